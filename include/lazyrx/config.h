#pragma once

// Name:      config.h
// Copyright: LazyRX authors 2025

#include <lazyrx/main.h>
#include <lazyrx/marshal.h>

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lrx {

using ConfigKeys   = std::map<std::string, std::string>;
using ConfigGroups = std::vector<std::pair<std::string, ConfigKeys>>;

//********************************************************************************************************************
// Config holds grouped key-values in the standard config format:
//
//   # Comment
//   [Group]
//   Key = Value
//
// Groups retain the order in which they were first declared.  Values can be read into any type that satisfies
// TextUnmarshaler, such as DeferredRegex, and written from any TextMarshaler.

class Config {
   private:
      ConfigGroups mGroups;

      ConfigKeys * find_group(std::string_view Name);
      const ConfigKeys * find_group(std::string_view Name) const;

   public:
      CNF Flags = CNF::NIL;

      Config() = default;
      explicit Config(CNF Options) : Flags(Options) { }

      ERR parse(std::string_view Text);
      ERR load(const std::string &Path);
      void clear() { mGroups.clear(); }

      ERR read(std::string_view Group, std::string_view Key, std::string &Value) const;
      ERR write(std::string_view Group, std::string_view Key, std::string_view Value);

      template <TextUnmarshaler T>
      ERR read(std::string_view Group, std::string_view Key, T &Value) const {
         std::string raw;
         if (auto error = read(Group, Key, raw); error != ERR::Okay) return error;
         return Value.unmarshal_text(std::span<const uint8_t>((const uint8_t *)raw.data(), raw.size()));
      }

      template <TextMarshaler T>
      ERR write(std::string_view Group, std::string_view Key, const T &Value) {
         std::vector<uint8_t> buffer;
         if (auto error = Value.marshal_text(buffer); error != ERR::Okay) return error;
         return write(Group, Key, std::string_view((const char *)buffer.data(), buffer.size()));
      }

      std::string serialise() const;

      const ConfigGroups & groups() const { return mGroups; }
      size_t total_groups() const { return mGroups.size(); }
      size_t total_keys() const;
};

} // namespace lrx
