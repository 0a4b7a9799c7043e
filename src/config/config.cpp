/*********************************************************************************************************************

The source code of the LazyRX project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
Config: Manages the reading and writing of configuration files.

The Config class is provided for reading text based key-values in a simple structured format.  The following segment
of a config file illustrates:

<pre>
# Patterns used by the log scanner
[Scanner]
Version = ([0-9]+)\.([0-9]+)\.([0-9]+)
Ignore  = "^\s*#"
</pre>

Text enclosed in square brackets, such as `[Scanner]`, names a 'group' that holds the key-values that follow it.
Keys that appear before the first group are ignored.  Lines that start with `#` are comments.

Values are stored as plain strings.  Reading a value into a `DeferredRegex` stores the pattern without compiling it:

<pre>
lrx::Config cfg;
lrx::DeferredRegex version;
if (cfg.load("scanner.cfg") IS ERR::Okay) cfg.read("Scanner", "Version", version);
</pre>

If the `CNF::STRIP_QUOTES` flag is set, values that start with a double quote are read up to the closing quote and
the quotes are removed.  This permits values with leading or trailing whitespace.

Group and key names are case sensitive.

-END-

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/log.h>
#include <lazyrx/config.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace lrx {

//********************************************************************************************************************

template <class T>
static T next_line(T Data)
{
   while ((*Data != '\n') and (*Data)) Data++;
   while ((*Data) and (uint8_t(*Data) <= 0x20)) Data++; // Skip empty lines and any leading whitespace
   return Data;
}

//********************************************************************************************************************
// Searches for the next group in a text buffer, returns its name and the start of the first key value.

template <class T>
static T next_group(T Data, std::string &GroupName)
{
   while (*Data) {
      if (*Data IS '[') {
         int len;
         for (len=1; (Data[len] != '\n') and (Data[len]); len++) {
            if (Data[len] IS '[') break; // Invalid character check
            if (Data[len] IS ']') {
               GroupName.assign(Data, 1, len-1);
               return next_line(Data+len); // Skip all trailing characters to reach the next line
            }
         }
         Data += len;
      }
      Data = next_line(Data);
   }
   return Data;
}

//********************************************************************************************************************
// Checks the next line in a buffer to see if it is a valid key.

static bool check_for_key(CSTRING Data)
{
   if ((*Data != '\n') and (*Data != '\r') and (*Data != '[') and (*Data != '#')) {
      while ((*Data) and (*Data != '\n') and (*Data != '\r') and (*Data != '=')) Data++; // Skip key name
      return *Data IS '=';
   }

   return false;
}

//********************************************************************************************************************

ConfigKeys * Config::find_group(std::string_view Name)
{
   for (auto &[group, keys] : mGroups) {
      if (group IS Name) return &keys;
   }
   return nullptr;
}

const ConfigKeys * Config::find_group(std::string_view Name) const
{
   for (auto &[group, keys] : mGroups) {
      if (group IS Name) return &keys;
   }
   return nullptr;
}

/*********************************************************************************************************************

-METHOD-
parse: Parses config formatted text and merges the key-values into the object.

Keys that already exist are overwritten by the parsed values.

-INPUT-
cpp(strview) Text: Config formatted text.

-ERRORS-
Okay
NoData: The Text is empty.
-END-

*********************************************************************************************************************/

ERR Config::parse(std::string_view Text)
{
   Log log(__FUNCTION__);

   if (Text.empty()) return ERR::NoData;

   log.traceBranch("%.20s", std::string(Text.substr(0, 20)).c_str());

   const std::string buffer(Text); // Guarantees null termination
   CSTRING data = buffer.c_str();

   std::string group_name;
   data = next_group(data, group_name); // Find the first group

   while (*data) {
      while ((*data) and (uint8_t(*data) <= 0x20)) data++;
      if (*data IS '#') { // Commented
         data = next_line(data);
         continue;
      }

      ConfigKeys *current_group = nullptr;
      while ((*data) and (*data != '[')) { // Keep processing keys until either a new group or EOF is reached
         if (check_for_key(data)) {
            int len;
            for (len=0; (data[len]) and (data[len] != '='); len++);
            int keylen = len;
            while ((keylen > 0) and (uint8_t(data[keylen-1]) <= 0x20)) keylen--;
            std::string key(data, keylen);
            data += len + 1;

            while ((*data IS ' ') or (*data IS '\t')) data++;

            std::string value;
            if (((Flags & CNF::STRIP_QUOTES) != CNF::NIL) and (*data IS '"')) {
               data++;
               for (len=0; (data[len]) and (data[len] != '"'); len++);
               value.assign(data, len);
               data += len;
            }
            else {
               for (len=0; (data[len]) and (data[len] != '\n') and (data[len] != '\r'); len++);
               while ((len > 0) and ((data[len-1] IS ' ') or (data[len-1] IS '\t'))) len--;
               value.assign(data, len);
               data += len;
            }
            data = next_line(data);

            if (key.empty()) {
               log.warning("Ignoring value with no key in group '%s'.", group_name.c_str());
               continue;
            }

            if (!current_group) { // Check if a matching group already exists before creating a new one
               current_group = find_group(group_name);
               if (!current_group) {
                  auto &new_group = mGroups.emplace_back();
                  new_group.first = group_name;
                  current_group = &new_group.second;
               }
            }
            (*current_group)[key] = value;
         }
         else data = next_line(data);
      }
      data = next_group(data, group_name);
   }

   return ERR::Okay;
}

/*********************************************************************************************************************

-METHOD-
load: Parses the content of a config file.

-INPUT-
cpp(str) Path: Location of the file.

-ERRORS-
Okay
File: The file could not be opened.
Read: The file could not be read.
NoData: The file is empty.
-END-

*********************************************************************************************************************/

ERR Config::load(const std::string &Path)
{
   Log log(__FUNCTION__);

   log.branch("%s", Path.c_str());

   std::ifstream file(Path, std::ios::in | std::ios::binary);
   if (not file.is_open()) return log.warning(ERR::File);

   std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
   if (file.bad()) return log.warning(ERR::Read);

   LogLevel level(2);
   if (auto error = parse(content); error != ERR::Okay) return error;

   log.msg("Loaded %d groups and %d keys.", int(total_groups()), int(total_keys()));
   return ERR::Okay;
}

/*********************************************************************************************************************

-METHOD-
read: Reads the value of a key.

The template variant passes the raw value to the `unmarshal_text()` method of the target.

-INPUT-
cpp(strview) Group: The name of the group.
cpp(strview) Key: The name of the key.
&cpp(str) Value: Receives the value.

-ERRORS-
Okay
Search: The group or key does not exist.
-END-

*********************************************************************************************************************/

ERR Config::read(std::string_view Group, std::string_view Key, std::string &Value) const
{
   Log log(__FUNCTION__);

   if (auto keys = find_group(Group)) {
      if (auto it = keys->find(std::string(Key)); it != keys->end()) {
         Value = it->second;
         return ERR::Okay;
      }
   }

   log.trace("Could not find key %.*s : %.*s.", int(Group.size()), Group.data(), int(Key.size()), Key.data());
   return ERR::Search;
}

/*********************************************************************************************************************

-METHOD-
write: Writes a new value to a key.

The group is created if it does not already exist.  An existing key is overwritten.

-ERRORS-
Okay
NullArgs: The Group or Key is empty.
-END-

*********************************************************************************************************************/

ERR Config::write(std::string_view Group, std::string_view Key, std::string_view Value)
{
   Log log(__FUNCTION__);

   if ((Group.empty()) or (Key.empty())) return log.warning(ERR::NullArgs);

   log.trace("%.*s.%.*s = %.*s", int(Group.size()), Group.data(), int(Key.size()), Key.data(), int(Value.size()), Value.data());

   if (auto keys = find_group(Group)) {
      (*keys)[std::string(Key)] = Value;
      return ERR::Okay;
   }

   auto &new_group = mGroups.emplace_back();
   new_group.first.assign(Group);
   new_group.second[std::string(Key)].assign(Value);
   return ERR::Okay;
}

//********************************************************************************************************************
// Returns the key-values in standard config format.  Values are quoted if the object uses STRIP_QUOTES and the value
// would otherwise lose leading or trailing whitespace.

std::string Config::serialise() const
{
   std::ostringstream out;

   for (auto &[group, keys] : mGroups) {
      out << "\n[" << group << "]\n";

      for (auto &[k, v] : keys) {
         const bool padded = (not v.empty()) and ((uint8_t(v.front()) <= 0x20) or (uint8_t(v.back()) <= 0x20));
         if (padded and ((Flags & CNF::STRIP_QUOTES) != CNF::NIL)) out << k << " = \"" << v << "\"\n";
         else out << k << " = " << v << "\n";
      }
   }

   return out.str();
}

size_t Config::total_keys() const
{
   size_t total = 0;
   for (const auto &[group, keys] : mGroups) total += keys.size();
   return total;
}

} // namespace lrx
