/*********************************************************************************************************************

The source code of the LazyRX project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

-CATEGORY-
Name: Errors
-END-

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/errors.h>

#include <array>
#include <string>

namespace lrx {

// Read-only table of error messages, indexed by ERR.

static constexpr std::array<CSTRING, int(ERR::END)> glMessages = {
   "Operation successful.",
   "Required argument was not provided.",
   "Invalid arguments were specified.",
   "Syntax error.",
   "A search did not find a match.",
   "No data is available for use.",
   "File error, e.g. file not found.",
   "Error reading data.",
   "Invalid value.",
   "The process was terminated."
};

/*********************************************************************************************************************

-FUNCTION-
GetErrorMsg: Translates error codes into human readable strings.

The GetErrorMsg() function converts error codes into human readable strings.  If the `Code` is invalid, a string of
"Unknown error code." is returned.

-INPUT-
error Code: The error code to lookup.

-RESULT-
cstr: A human readable string for the error code is returned.

*********************************************************************************************************************/

CSTRING GetErrorMsg(ERR Code)
{
   if ((int(Code) >= 0) and (int(Code) < int(ERR::END))) return glMessages[int(Code)];
   else return "Unknown error code.";
}

//********************************************************************************************************************

static std::string compose_message(ERR Code, const std::string &Detail)
{
   if (Detail.empty()) return GetErrorMsg(Code);
   return std::string(GetErrorMsg(Code)) + " " + Detail;
}

RegexError::RegexError(ERR Code, const std::string &Pattern, const std::string &Detail)
   : std::runtime_error(compose_message(Code, Detail)), code_(Code), pattern_(Pattern), detail_(Detail)
{
}

} // namespace lrx
