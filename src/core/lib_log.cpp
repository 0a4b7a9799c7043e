/*********************************************************************************************************************

The source code of the LazyRX project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

-CATEGORY-
Name: Logging
-END-

This file contains all logging functions.

Log levels are:

0  CRITICAL Display the message irrespective of the log level.
1  ERROR Major errors that should be displayed to the user.
2  WARN Any error suitable for display to a developer or technically minded user (default).
3  Application log message, level 1
4  INFO Application log message, level 2
5  API Top-level API messages, e.g. function entry points.
6  DETAIL Detailed API messages.  For messages within functions, and entry-points for minor functions.
8  TRACE Extremely detailed API messages suitable for intensive debugging only.
9  Noisy debug messages that will appear frequently, e.g. being used in inner loops.

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/log.h>

#include <stdio.h>
#include <stdarg.h>
#include <array>
#include <atomic>
#include <mutex>
#include <span>
#include <string>

namespace lrx {

static const int COLUMN1 = 30;

enum { MS_NONE, MS_FUNCTION, MS_MSG };

static std::atomic<int> glLogLevel = 2;
static std::mutex glmPrint;
static thread_local int tlBaseLine = 0;
static thread_local int tlDepth = 0;

static void fmsg(CSTRING, char *, int8_t);

namespace {

struct PreparedLogLine {
   std::array<char, COLUMN1+1> Header{};
   std::string Message;
   bool Highlight = false;
};

struct TerminalSink {
   TerminalSink();
   void operator()(const PreparedLogLine &Line) const;

   bool SupportsColour;
};

static std::array<TerminalSink, 1> glLogSinks { TerminalSink{} };

static constexpr std::array<VLF, 10> LOG_LEVELS = {
   VLF::CRITICAL,
   VLF::ERROR|VLF::CRITICAL,
   VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL
};

static void dispatch_to_sinks(const PreparedLogLine &Line)
{
   auto sinks = std::span<const TerminalSink>(glLogSinks);
   for (const auto &sink : sinks) sink(Line);
}

TerminalSink::TerminalSink()
{
#ifdef _WIN32
   SupportsColour = false;
#else
   SupportsColour = true;
#endif
}

void TerminalSink::operator()(const PreparedLogLine &Line) const
{
   if (Line.Highlight) {
      if (SupportsColour) fprintf(stderr, "\033[1m");
      else fputc('!', stderr);
   }

   fprintf(stderr, "%s%s", Line.Header.data(), Line.Message.c_str());

   if (Line.Highlight and SupportsColour) fprintf(stderr, "\033[0m");

   fprintf(stderr, "\n");
}

static std::string format_message(CSTRING Message, va_list Args)
{
   if (!Message) return std::string();

   va_list copy;
   va_copy(copy, Args);
   int required = vsnprintf(nullptr, 0, Message, copy);
   va_end(copy);

   if (required <= 0) return std::string();

   std::string buffer;
   buffer.resize(required);
   va_copy(copy, Args);
   vsnprintf(buffer.data(), buffer.size()+1, Message, copy);
   va_end(copy);

   return buffer;
}

static bool should_log(VLF Flags, int LogSetting)
{
   if ((Flags & VLF::CRITICAL) != VLF::NIL) return true;

   int level = LogSetting - tlBaseLine;
   if (level > 9) level = 9;
   else if (level < 0) level = 0;

   if ((LOG_LEVELS[level] & Flags) != VLF::NIL) return true;

   // Warnings and errors are never suppressed by a raised base-line.
   return (LogSetting > 1) and ((Flags & (VLF::WARNING|VLF::ERROR)) != VLF::NIL);
}

} // namespace

/*********************************************************************************************************************

-FUNCTION-
AdjustLogLevel: Adjusts the base-line of all log messages.

This function adjusts the detail level of all outgoing log messages for the calling thread.  Setting the `Delta`
value to 1 would result in level 5 (API) log messages being bumped to level 6.  Adjustments are accumulative; to
revert, call this function again with a negation of the previously passed value.

-INPUT-
int Delta: The level of adjustment to make to new log messages.  Zero is no change.  The maximum level is +/- 6.

-RESULT-
int: Returns the base-line value that was active prior to calling this function.

*********************************************************************************************************************/

int AdjustLogLevel(int Delta)
{
   if (glLogLevel.load(std::memory_order_relaxed) >= 9) return tlBaseLine; // Do nothing if trace logging is active.
   int old_level = tlBaseLine;
   if ((Delta >= -6) and (Delta <= 6)) tlBaseLine += Delta;
   return old_level;
}

//********************************************************************************************************************
// Sets the process-wide log level, clamped to 0 - 9.

void SetLogLevel(int Level)
{
   if (Level < 0) Level = 0;
   else if (Level > 9) Level = 9;
   glLogLevel.store(Level, std::memory_order_relaxed);
}

int GetLogLevel(void)
{
   return glLogLevel.load(std::memory_order_relaxed);
}

/*********************************************************************************************************************

-FUNCTION-
VLogF: Sends formatted messages to the standard log.
Status: Internal

Log message formatting follows the same guidelines as the `printf()` function.  Messages that do not pass the
active log level are discarded, but branch requests are still counted so that indentation remains balanced.

Clients should use the scope-managed `lrx::Log` class rather than calling this function directly.

-INPUT-
int(VLF) Flags: Optional flags
cstr Header: A short name for the first column.  Typically function names are placed here.
cstr Message: A formatted message to print.
va_list Args: A `va_list` corresponding to the arguments referenced in `Message`.
-END-

*********************************************************************************************************************/

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args)
{
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);

   if (should_log(Flags, log_setting)) {
      PreparedLogLine line;
      line.Message   = format_message(Message ? Message : "", Args);
      line.Highlight = ((Flags & VLF::CRITICAL) != VLF::NIL) or
         ((log_setting > 2) and ((Flags & (VLF::ERROR|VLF::WARNING)) != VLF::NIL));

      auto state = ((Flags & (VLF::BRANCH|VLF::FUNCTION)) != VLF::NIL) ? MS_FUNCTION : MS_MSG;
      fmsg(Header, line.Header.data(), state);

      std::lock_guard lock(glmPrint);
      dispatch_to_sinks(line);
   }

   if ((Flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
}

/*********************************************************************************************************************

-FUNCTION-
FuncError: Sends basic error messages to the log.
Status: Internal

Outputs the message associated with an error code, e.g. `FuncError("Split", ERR::NullArgs)` produces
`Split: Required argument was not provided.`  Messages are only printed at log level 2 or above.

-INPUT-
cstr Header: A short string that names the function that is making the call.
error Code: An error code.

-RESULT-
error: Returns the same code that was specified in the `Code` parameter.

*********************************************************************************************************************/

ERR FuncError(CSTRING Header, ERR Code)
{
   if (glLogLevel.load(std::memory_order_relaxed) < 2) return Code;

   char msgheader[COLUMN1+1];
   fmsg(Header ? Header : "Function", msgheader, MS_MSG);

   CSTRING histart = "", hiend = "";
   if (glLogLevel.load(std::memory_order_relaxed) > 2) {
      #ifdef _WIN32
         histart = "!";
      #else
         histart = "\033[1m";
         hiend = "\033[0m";
      #endif
   }

   std::lock_guard lock(glmPrint);
   fprintf(stderr, "%s%s%s%s\n", histart, msgheader, GetErrorMsg(Code), hiend);
   return Code;
}

/*********************************************************************************************************************

-FUNCTION-
LogReturn: Revert to the previous branch in the logging tree.
Status: Internal

Reverses any previous log message that created an indented branch.  Clients must use the scope-managed `lrx::Log`
class for branched log output.

-END-

*********************************************************************************************************************/

void LogReturn(void)
{
   if ((--tlDepth) < 0) tlDepth = 0;
}

//********************************************************************************************************************

static void fmsg(CSTRING Header, char *Buffer, int8_t Colon) // Buffer must be COLUMN1+1 in size
{
   if ((!Header) or (!*Header)) Header = "App";

   int16_t pos = 0;
   int16_t col = COLUMN1;
   int16_t depth;

   auto log_setting = glLogLevel.load(std::memory_order_relaxed);

   if (log_setting < 3) depth = 0;
   else if (tlDepth > col) depth = col;
   else depth = tlDepth;

   while ((depth > 0) and (pos < col)) {
      Buffer[pos++] = ' ';
      depth--;
   }

   int16_t len;
   for (len=0; (Header[len]) and (pos < col); len++) Buffer[pos++] = Header[len];

   auto last = len ? Header[len-1] : ':';
   if ((last != ':') and (last != ')')) {
      if (Colon IS MS_FUNCTION) {
         if (pos < col-1) {
            Buffer[pos++] = '(';
            Buffer[pos++] = ')';
         }
      }
      else if (pos < col) Buffer[pos++] = ':';
   }

   if (log_setting >= 3) while (pos < col) Buffer[pos++] = ' '; // Align the message column
   else if (pos < col) Buffer[pos++] = ' ';

   Buffer[pos] = 0; // NB: Buffer is col + 1, so there is always room for the null byte.
}

} // namespace lrx
