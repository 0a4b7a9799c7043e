/*********************************************************************************************************************

The source code of the LazyRX project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
ArgParser: Reads command-line options into registered values.

Options are registered with `add()`, each with a name, a target and a line of help text.  A call to `parse()` then
assigns option values in the order that they appear.  Option names are compared case-insensitively and are written
on the command-line with a `--` prefix, e.g. `--filter abc` or `--filter=abc`.

Arguments that do not name a registered option are kept as positional arguments.  Their order is retained.

The following illustrates loading a pattern from the command-line.  The pattern is not compiled until it is used:

<pre>
lrx::DeferredRegex filter{"."};
lrx::ArgParser args("Prints the lines of a file that match a filter.");
args.add("filter", filter, "Regular expression to match against each line.");
if (args.parse(argc, argv) != ERR::Okay) return 1;
</pre>

-END-

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/log.h>
#include <lazyrx/args.h>
#include <lazyrx/strings.hpp>

#include <stdio.h>

namespace lrx {

static const size_t HELP_COLUMN = 20;

//********************************************************************************************************************

ArgParser::Option * ArgParser::find_option(std::string_view Name)
{
   for (auto &opt : mOptions) {
      if (iequals(opt.name, Name)) return &opt;
   }
   return nullptr;
}

//********************************************************************************************************************
// Registers a switch.  A switch is set to true if named without a value, or it can be given an explicit value with
// --name=true or --name=false.

void ArgParser::add(std::string_view Name, bool &Switch, std::string_view Help)
{
   auto &opt = mOptions.emplace_back();
   opt.name.assign(Name);
   opt.help.assign(Help);
   opt.is_switch = true;
   opt.assign = [&Switch](std::string_view Value) {
      if ((Value.empty()) or iequals(Value, "true") or iequals(Value, "yes") or (Value IS "1")) Switch = true;
      else if (iequals(Value, "false") or iequals(Value, "no") or (Value IS "0")) Switch = false;
      else return ERR::InvalidValue;
      return ERR::Okay;
   };
   opt.render = [&Switch]() { return std::string(Switch ? "true" : "false"); };
}

void ArgParser::add(std::string_view Name, std::string &Value, std::string_view Help)
{
   auto &opt = mOptions.emplace_back();
   opt.name.assign(Name);
   opt.help.assign(Help);
   opt.assign = [&Value](std::string_view Input) {
      Value.assign(Input);
      return ERR::Okay;
   };
   opt.render = [&Value]() { return Value; };
}

/*********************************************************************************************************************

-METHOD-
parse: Processes a list of command-line arguments.

The program name must not be included in Args.  If the `parse(argc, argv)` variant is used then `argv[0]` is skipped
automatically.

-ERRORS-
Okay
Terminate: The user requested `--help`.  Usage information has been printed.
Args: An option that requires a value was given none.
InvalidValue: A switch was given a value that is not a boolean.
-END-

*********************************************************************************************************************/

ERR ArgParser::parse(std::span<const std::string> Args)
{
   Log log("ArgParser");

   mPositional.clear();

   for (size_t i=0; i < Args.size(); i++) {
      std::string_view arg(Args[i]);

      if (arg IS "--") { // End of options
         for (++i; i < Args.size(); i++) mPositional.push_back(Args[i]);
         break;
      }

      if ((arg.size() < 3) or (not arg.starts_with("--"))) {
         mPositional.push_back(Args[i]);
         continue;
      }

      auto name = arg.substr(2);
      std::string_view value;
      bool has_value = false;
      if (auto eq = name.find('='); eq != std::string_view::npos) {
         value = name.substr(eq + 1);
         name = name.substr(0, eq);
         has_value = true;
      }

      if (auto opt = find_option(name)) {
         if ((not has_value) and (not opt->is_switch)) {
            if (i + 1 >= Args.size()) {
               log.warning("Option --%s requires a value.", opt->name.c_str());
               return ERR::Args;
            }
            value = Args[++i];
         }

         if (auto error = opt->assign(value); error != ERR::Okay) {
            log.warning("Invalid value '%.*s' for option --%s.", int(value.size()), value.data(), opt->name.c_str());
            return error;
         }
      }
      else if (iequals(name, "help")) {
         printf("%s", usage().c_str());
         return ERR::Terminate;
      }
      else if (iequals(name, "log-api")) SetLogLevel(5);
      else if (iequals(name, "log-info")) SetLogLevel(4);
      else if (iequals(name, "log-error")) SetLogLevel(1);
      else mPositional.push_back(Args[i]);
   }

   log.detail("Parsed %d arguments, %d positional.", int(Args.size()), int(mPositional.size()));
   return ERR::Okay;
}

ERR ArgParser::parse(int argc, char **argv)
{
   std::vector<std::string> args;
   if (argv) {
      for (int i=1; i < argc; i++) {
         if (argv[i]) args.emplace_back(argv[i]);
      }
   }
   return parse(args);
}

//********************************************************************************************************************
// Returns the help text for all registered options.  Current values are shown as defaults.

std::string ArgParser::usage() const
{
   std::string out;

   if (not mDescription.empty()) out += mDescription + "\n\n";

   out += "The following options are available:\n\n";

   auto append = [&](std::string_view Name, std::string_view Help, const std::string &Default) {
      std::string left(" --");
      left.append(Name);
      if (left.size() < HELP_COLUMN - 1) left.resize(HELP_COLUMN - 1, ' ');
      out += left + " ";
      out.append(Help);
      if (not Default.empty()) out += " (default: " + Default + ")";
      out += "\n";
   };

   for (auto &opt : mOptions) {
      append(opt.name, opt.help, opt.render ? opt.render() : std::string());
   }

   out += "\n";
   append("help", "Prints this help text.", std::string());
   append("log-api", "Activates run-time log messages at API level.", std::string());
   append("log-info", "Activates run-time log messages at INFO level.", std::string());
   append("log-error", "Activates run-time log messages at ERROR level.", std::string());

   return out;
}

} // namespace lrx
