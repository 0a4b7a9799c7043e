#pragma once

// Name:      args.h
// Copyright: LazyRX authors 2025

#include <lazyrx/main.h>
#include <lazyrx/marshal.h>

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lrx {

//********************************************************************************************************************
// ArgParser reads `--name value` and `--name=value` options from a command line into registered targets.  Any type
// that satisfies FlagUnmarshaler can be registered, which includes DeferredRegex.  Registered targets are referenced,
// not copied, and must outlive the parser.
//
// The following options are built in:
//
//   --help        Prints usage information and causes parse() to return ERR::Terminate.
//   --log-api     Activates log messages at API level.
//   --log-info    Activates log messages at INFO level.
//   --log-error   Restricts log messages to errors only.
//   --            All following arguments are treated as positional.

class ArgParser {
   private:
      struct Option {
         std::string name;
         std::string help;
         bool is_switch = false;
         std::function<ERR(std::string_view)> assign;
         std::function<std::string()> render;
      };

      std::string mDescription;
      std::vector<Option> mOptions;
      std::vector<std::string> mPositional;

      Option * find_option(std::string_view Name);

   public:
      ArgParser() = default;
      explicit ArgParser(std::string_view Description) : mDescription(Description) { }

      template <class T> requires FlagUnmarshaler<T> and FlagMarshaler<T>
      void add(std::string_view Name, T &Target, std::string_view Help) {
         auto &opt = mOptions.emplace_back();
         opt.name.assign(Name);
         opt.help.assign(Help);
         opt.assign = [&Target](std::string_view Value) { return Target.unmarshal_flag(Value); };
         opt.render = [&Target]() {
            std::string out;
            if (Target.marshal_flag(out) != ERR::Okay) out.clear();
            return out;
         };
      }

      void add(std::string_view Name, bool &Switch, std::string_view Help);
      void add(std::string_view Name, std::string &Value, std::string_view Help);

      ERR parse(std::span<const std::string> Args);
      ERR parse(int argc, char **argv);

      std::string usage() const;
      const std::vector<std::string> & positional() const { return mPositional; }
};

} // namespace lrx
