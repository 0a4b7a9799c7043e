/*********************************************************************************************************************

The source code of the LazyRX project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
DeferredRegex: A regular expression that is compiled on first use.

DeferredRegex stores the source of a pattern and defers its compilation until the first time that a matching,
replacement, splitting or introspection method is called.  This removes the start-up cost of patterns that a given
run never executes, while the interface remains identical to that of a compiled Regex.

Compilation is performed exactly once, even if many threads make their first call at the same time.  Callers that
arrive while compilation is in progress wait for it to complete and then share the compiled result.

The pattern can be loaded from configuration text (`unmarshal_text()`) or from a command-line argument
(`unmarshal_flag()`).  Neither operation validates or compiles the pattern, so an invalid pattern is only reported
when the object is first used.  At that point the error is logged and `RegexError` is raised.  Programs that prefer
to handle an invalid pattern gracefully can call `compile()` ahead of use.

Assigning a new pattern after the first use has no effect on matching.  The compiled engine is never rebuilt.

-END-

*********************************************************************************************************************/

#include <lazyrx/deferred.h>

namespace lrx {

template class Deferred<Regex>;

} // namespace lrx
