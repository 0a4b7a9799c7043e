/*********************************************************************************************************************

The source code of the LazyRX project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-MODULE-
Regex: Compiled ECMAScript regular expressions.

The Regex class provides ECMAScript-compatible regex functionality with UTF-8 support, backed by the SRELL engine.
It offers pattern compilation, search and match operations, template-based and callback-based replacement, splitting
and introspection of capture groups.

Every operation is provided in a text form (`std::string_view` input, owned `std::string` output) and a byte form
(`std::span<const uint8_t>` input, output views that refer back into the input buffer).

-END-

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/log.h>
#include <lazyrx/regex.h>
#include <lazyrx/strings.hpp>
#include <srell.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <istream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace lrx {

namespace {

struct regex_engine : public srell::u8cregex {
   using srell::u8cregex::u8cregex;

   bool resolve_named_capture(const std::string_view &Name, std::vector<int> &Indices) const
   {
      using view_type = typename srell::re_detail::groupname_mapper<char>::view_type;
      view_type name_view(Name.data(), Name.size());

      const srell::re_detail::ui_l32 *list = this->namedcaptures[name_view];

      if ((not list) or (list[0] IS 0)) return false;

      for (srell::re_detail::ui_l32 i = 1; i <= list[0]; ++i) {
         Indices.push_back((int)list[i]);
      }

      return true;
   }

   std::string group_name(unsigned Index) const
   {
      auto view = this->namedcaptures[srell::re_detail::ui_l32(Index)];
      if ((not view.data_) or (view.size_ IS 0)) return std::string();
      return std::string(view.data_, view.size_);
   }
};

std::string map_error_code(unsigned int ErrorCode)
{
   if (ErrorCode IS 0u) return std::string("ok");

   switch (ErrorCode) {
      case srell::regex_constants::error_collate: return std::string("error_collate: invalid collating element");
      case srell::regex_constants::error_ctype: return std::string("error_ctype: invalid character class");
      case srell::regex_constants::error_escape: return std::string("error_escape: invalid escape sequence");
      case srell::regex_constants::error_backref: return std::string("error_backref: invalid back reference");
      case srell::regex_constants::error_brack: return std::string("error_brack: mismatched brackets");
      case srell::regex_constants::error_paren: return std::string("error_paren: mismatched parentheses");
      case srell::regex_constants::error_brace: return std::string("error_brace: mismatched braces");
      case srell::regex_constants::error_badbrace: return std::string("error_badbrace: invalid range quantifier");
      case srell::regex_constants::error_range: return std::string("error_range: invalid character range");
      case srell::regex_constants::error_space: return std::string("error_space: insufficient memory");
      case srell::regex_constants::error_badrepeat: return std::string("error_badrepeat: nothing to repeat");
      case srell::regex_constants::error_complexity: return std::string("error_complexity: pattern is too complex");
      case srell::regex_constants::error_stack: return std::string("error_stack: stack exhausted");
      case srell::regex_constants::error_utf8: return std::string("error_utf8: invalid UTF-8 sequence");
      case srell::regex_constants::error_property: return std::string("error_property: unknown Unicode property");
      case srell::regex_constants::error_noescape: return std::string("error_noescape: escape is required in Unicode set mode");
      case srell::regex_constants::error_operator: return std::string("error_operator: invalid set operator in Unicode set mode");
      case srell::regex_constants::error_complement: return std::string("error_complement: invalid complement in Unicode set mode");
      case srell::regex_constants::error_modifier: return std::string("error_modifier: duplicated or misplaced inline modifier");
      default: break;
   }

   if (ErrorCode IS srell::regex_constants::error_internal) return std::string("error_internal: internal engine failure");

   return std::string("error_unknown: ") + std::to_string(ErrorCode);
}

//********************************************************************************************************************

inline std::string_view as_text(ByteView Bytes)
{
   return std::string_view((const char *)Bytes.data(), Bytes.size());
}

inline ByteView slice(ByteView Bytes, const CaptureSpan &Span)
{
   if (not Span.matched()) return ByteView();
   return Bytes.subspan(Span.offset, Span.length);
}

inline std::string_view slice(std::string_view Text, const CaptureSpan &Span)
{
   if (not Span.matched()) return std::string_view();
   return Text.substr(Span.offset, Span.length);
}

// Reads the remainder of a stream for the std::istream forms of the matching functions.

std::string read_stream(std::istream &Input)
{
   Log log("Regex");

   std::string content((std::istreambuf_iterator<char>(Input)), std::istreambuf_iterator<char>());
   if (Input.bad()) log.warning("Failed to read the input stream; %d bytes were received.", int(content.size()));
   return content;
}

// SRELL requires a valid pointer even for empty input.

inline std::string_view normalise(std::string_view Text)
{
   if (Text.data()) return Text;
   return std::string_view("", 0);
}

//********************************************************************************************************************
// Returns true if the pattern contains a '|' that is not nested within a group or character class.

bool has_top_level_alternation(std::string_view Pattern)
{
   int depth = 0;
   bool in_class = false;

   for (size_t i = 0; i < Pattern.size(); i++) {
      const char c = Pattern[i];
      if (c IS '\\') { i++; continue; }

      if (in_class) {
         if (c IS ']') in_class = false;
      }
      else if (c IS '[') in_class = true;
      else if (c IS '(') depth++;
      else if (c IS ')') depth--;
      else if ((c IS '|') and (depth IS 0)) return true;
   }

   return false;
}

//********************************************************************************************************************
// Returns true if the pattern contains a lookahead assertion outside of a character class.

bool has_lookahead(std::string_view Pattern)
{
   bool in_class = false;

   for (size_t i = 0; i < Pattern.size(); i++) {
      const char c = Pattern[i];
      if (c IS '\\') { i++; continue; }

      if (in_class) {
         if (c IS ']') in_class = false;
      }
      else if (c IS '[') in_class = true;
      else if ((c IS '(') and (i + 2 < Pattern.size()) and (Pattern[i+1] IS '?')) {
         if ((Pattern[i+2] IS '=') or (Pattern[i+2] IS '!')) return true;
      }
   }

   return false;
}

//********************************************************************************************************************
// Returns true if the character at the start of Text is matched by \w.  Case-insensitive patterns also treat U+017F
// and U+212A as word characters, as they fold to 's' and 'k'.

bool is_word_char(std::string_view Text, bool CaseInsensitive)
{
   if (Text.empty()) return false;

   const char c = Text[0];
   if ((c IS '_') or ((c >= '0') and (c <= '9')) or ((c >= 'a') and (c <= 'z')) or ((c >= 'A') and (c <= 'Z'))) return true;

   if (CaseInsensitive) {
      return Text.starts_with("\xc5\xbf") or Text.starts_with("\xe2\x84\xaa");
   }

   return false;
}

//********************************************************************************************************************

srell::regex_constants::syntax_option_type syntax_flags(REGEX Flags)
{
   auto reg_flags = srell::regex_constants::ECMAScript;
   if ((Flags & REGEX::ICASE) != REGEX::NIL)     reg_flags |= srell::regex_constants::icase;
   if ((Flags & REGEX::MULTILINE) != REGEX::NIL) reg_flags |= srell::regex_constants::multiline;
   if ((Flags & REGEX::DOT_ALL) != REGEX::NIL)   reg_flags |= srell::regex_constants::dotall;
   return reg_flags;
}

//********************************************************************************************************************
// Computes the literal text that every match must begin with.  The boolean result is true if the prefix accounts
// for the entire pattern.

std::pair<std::string, bool> scan_literal_prefix(std::string_view Pattern, REGEX Flags)
{
   static constexpr std::string_view SPECIALS = "^$.*+?()[]{}|\\";

   if ((Flags & REGEX::ICASE) != REGEX::NIL) return { std::string(), false };
   if (has_top_level_alternation(Pattern)) return { std::string(), false };

   std::string prefix;
   size_t i = 0;

   while (i < Pattern.size()) {
      const size_t atom_start = i;
      std::string_view atom;
      const char c = Pattern[i];

      if (c IS '\\') {
         if (i + 1 >= Pattern.size()) break;
         const char e = Pattern[i+1];

         if (std::ispunct((uint8_t)e)) atom = Pattern.substr(i+1, 1);
         else if (e IS 'n') atom = "\n";
         else if (e IS 't') atom = "\t";
         else if (e IS 'r') atom = "\r";
         else if (e IS 'f') atom = "\f";
         else if (e IS 'v') atom = "\v";
         else break; // Character classes, back-references and assertions end the prefix

         i += 2;
      }
      else if (SPECIALS.find(c) != std::string_view::npos) break;
      else {
         const size_t len = utf8_char_length(Pattern.substr(i));
         atom = Pattern.substr(i, len);
         i += len;
      }

      if (i < Pattern.size()) {
         const char q = Pattern[i];
         if ((q IS '*') or (q IS '?') or (q IS '{')) { // The atom is optional or variable
            i = atom_start;
            break;
         }
         else if (q IS '+') { // The atom is required, but what follows it is not fixed
            prefix.append(atom);
            return { prefix, false };
         }
      }

      prefix.append(atom);
   }

   return { prefix, i >= Pattern.size() };
}

} // namespace

//********************************************************************************************************************

struct Regex::Implementation {
   regex_engine pattern;
   regex_engine anchored; // The pattern followed by an end-of-subject assertion, for leftmost-longest matching
   std::string source;
   REGEX flags = REGEX::NIL;
   unsigned int error_code = 0u;
   bool ready = false;
   bool longest = false;
   bool lookahead = false;

   bool next_match(std::string_view Text, size_t Position, std::vector<CaptureSpan> &Result) const;
   void extend_longest(std::string_view Text, srell::u8ccmatch &Match) const;

   template <class T> void for_each_match(std::string_view Text, int Limit, T &&Callback) const;
};

//********************************************************************************************************************
// Searches for the next match that starts at or after Position.  On success, Result receives one span per capture
// group with the complete match at index 0.

bool Regex::Implementation::next_match(std::string_view Text, size_t Position, std::vector<CaptureSpan> &Result) const
{
   Result.clear();

   const char *const text_begin = Text.data();
   const char *const text_end = text_begin + Text.size();

   auto native_flags = srell::regex_constants::match_default;
   if (Position > 0) native_flags |= srell::regex_constants::match_prev_avail;

   srell::u8ccmatch match;
   if (not pattern.search(text_begin + Position, text_end, text_begin, match, native_flags)) return false;

   if (longest) extend_longest(Text, match);

   Result.reserve(match.size());
   for (size_t i = 0; i < match.size(); i++) {
      const auto &sub = match[i];
      if (sub.matched) Result.push_back({ size_t(sub.first - text_begin), size_t(sub.second - sub.first) });
      else Result.push_back(CaptureSpan());
   }

   return true;
}

//********************************************************************************************************************
// Leftmost-longest support.  The backtracking engine reports the preferred match at the leftmost position; this
// extends it to the longest text that the pattern can match from the same starting point.
//
// Each candidate end is tested by running the anchored pattern over the subject cut at that point.  The assertions
// that can see the cut are told what actually follows it: '$' through match_not_eol and '\b' or '\B' through
// match_not_eow.  A lookahead would see the cut as the end of the text, so patterns that contain one only accept the
// true end of the text as a longer candidate.

void Regex::Implementation::extend_longest(std::string_view Text, srell::u8ccmatch &Match) const
{
   const char *const text_begin = Text.data();
   const char *const text_end = text_begin + Text.size();
   const char *const start = Match[0].first;
   const char *const current_end = Match[0].second;
   const bool multiline = (flags & REGEX::MULTILINE) != REGEX::NIL;
   const bool icase = (flags & REGEX::ICASE) != REGEX::NIL;

   for (const char *limit = text_end; limit > current_end; limit--) {
      auto native_flags = srell::regex_constants::match_continuous;
      if (start > text_begin) native_flags |= srell::regex_constants::match_prev_avail;

      if (limit < text_end) {
         if ((*limit & 0xc0) IS 0x80) continue; // Not a character boundary
         if (lookahead) continue;

         const std::string_view next(limit, text_end - limit);
         if (not (multiline and (*limit IS '\n'))) native_flags |= srell::regex_constants::match_not_eol;
         if (is_word_char(next, icase)) native_flags |= srell::regex_constants::match_not_eow;
      }

      srell::u8ccmatch candidate;
      if (anchored.search(start, limit, text_begin, candidate, native_flags)) {
         Match = candidate;
         return;
      }
   }
}

//********************************************************************************************************************
// Calls Callback for each successive match in Text, up to Limit matches (all matches if Limit is negative).

template <class T>
void Regex::Implementation::for_each_match(std::string_view Text, int Limit, T &&Callback) const
{
   const size_t max_matches = (Limit < 0) ? Text.size() + 1 : size_t(Limit);

   std::vector<CaptureSpan> spans;
   size_t position = 0;
   size_t total = 0;
   size_t prev_end = std::string::npos;

   while ((total < max_matches) and (position <= Text.size())) {
      if (not next_match(Text, position, spans)) break;

      bool accept = true;
      const size_t match_end = spans[0].end();

      if (match_end IS position) { // Empty match
         if (spans[0].offset IS prev_end) accept = false;

         if (position < Text.size()) position += utf8_char_length(Text.substr(position));
         else position = Text.size() + 1;
      }
      else position = match_end;

      prev_end = match_end;

      if (accept) {
         Callback(spans);
         total++;
      }
   }
}

//********************************************************************************************************************

Regex::Regex()
   : impl(std::make_unique<Implementation>())
{
}

Regex::Regex(Regex &&Other) noexcept = default;
Regex & Regex::operator=(Regex &&Other) noexcept = default;
Regex::~Regex() = default;

/*********************************************************************************************************************

-METHOD-
compile: Compiles a regex pattern.

Compiles Pattern with ECMAScript syntax.  The object becomes ready for matching only if compilation succeeds; on
failure the previous state is discarded and a readable description of the problem is written to ErrorMsg.

-INPUT-
cpp(strview) Pattern: A regex pattern string.
flags(REGEX) Flags: Optional flags.
&cpp(str) ErrorMsg: Optional reference for storing error messages.

-ERRORS-
Okay
Syntax
-END-

*********************************************************************************************************************/

ERR Regex::compile(std::string_view Pattern, REGEX Flags, std::string *ErrorMsg)
{
   Log log(__FUNCTION__);

   log.traceBranch("Pattern: '%.*s', Flags: $%.8x", int(Pattern.size()), Pattern.data(), unsigned(Flags));

   if (not impl) impl = std::make_unique<Implementation>();

   Pattern = normalise(Pattern);

   const auto reg_flags = syntax_flags(Flags);

   impl->source.assign(Pattern);
   impl->flags = Flags;
   impl->longest = false;
   impl->lookahead = false;
   impl->pattern.assign(Pattern.data(), Pattern.size(), reg_flags);
   impl->error_code = (unsigned int)impl->pattern.ecode();
   impl->ready = impl->error_code IS 0u;

   if (not impl->ready) {
      auto error_msg = map_error_code(impl->error_code);
      log.warning("Regex compilation failed: %s", error_msg.c_str());
      if (ErrorMsg) *ErrorMsg = error_msg;
      return ERR::Syntax;
   }

   return ERR::Okay;
}

bool Regex::is_ready() const
{
   return impl and impl->ready;
}

// Returns the source text of the pattern.

const std::string & Regex::string() const
{
   static const std::string empty;
   return impl ? impl->source : empty;
}

/*********************************************************************************************************************

-METHOD-
longest: Switches the regex to leftmost-longest matching.

Future searches prefer the leftmost match, and among those the longest.  This is a configuration step; it is not safe
to call while other threads are using the object.

-END-

*********************************************************************************************************************/

void Regex::longest()
{
   Log log(__FUNCTION__);

   if ((not is_ready()) or (impl->longest)) return;

   const std::string anchored = "(?:" + impl->source + ")(?![\\s\\S])";
   impl->anchored.assign(anchored.data(), anchored.size(), syntax_flags(impl->flags));
   if (impl->anchored.ecode() != 0) {
      log.warning("Leftmost-longest form of '%s' failed to compile: %s", impl->source.c_str(),
         map_error_code((unsigned int)impl->anchored.ecode()).c_str());
      return;
   }

   impl->lookahead = has_lookahead(impl->source);
   impl->longest = true;
}

//********************************************************************************************************************

bool Regex::match(std::string_view Text) const
{
   if (not is_ready()) return false;

   std::vector<CaptureSpan> spans;
   return impl->next_match(normalise(Text), 0, spans);
}

bool Regex::match(ByteView Bytes) const
{
   return match(as_text(Bytes));
}

bool Regex::match(std::istream &Input) const
{
   const auto content = read_stream(Input);
   return match(std::string_view(content));
}

//********************************************************************************************************************

std::optional<CaptureSpan> Regex::find_index(std::string_view Text) const
{
   if (not is_ready()) return std::nullopt;

   std::vector<CaptureSpan> spans;
   if (impl->next_match(normalise(Text), 0, spans)) return spans[0];
   return std::nullopt;
}

std::optional<CaptureSpan> Regex::find_index(ByteView Bytes) const
{
   return find_index(as_text(Bytes));
}

std::optional<CaptureSpan> Regex::find_index(std::istream &Input) const
{
   const auto content = read_stream(Input);
   return find_index(std::string_view(content));
}

std::optional<std::string> Regex::find(std::string_view Text) const
{
   if (auto span = find_index(Text)) return std::string(slice(Text, *span));
   return std::nullopt;
}

std::optional<ByteView> Regex::find(ByteView Bytes) const
{
   if (auto span = find_index(as_text(Bytes))) return slice(Bytes, *span);
   return std::nullopt;
}

//********************************************************************************************************************
// Submatch results are normalised so that their size is num_subexp() + 1.  Groups that did not participate are
// empty.

std::vector<CaptureSpan> Regex::find_submatch_index(std::string_view Text) const
{
   std::vector<CaptureSpan> spans;
   if (not is_ready()) return spans;

   if (not impl->next_match(normalise(Text), 0, spans)) spans.clear();
   return spans;
}

std::vector<CaptureSpan> Regex::find_submatch_index(ByteView Bytes) const
{
   return find_submatch_index(as_text(Bytes));
}

std::vector<CaptureSpan> Regex::find_submatch_index(std::istream &Input) const
{
   const auto content = read_stream(Input);
   return find_submatch_index(std::string_view(content));
}

std::vector<std::string> Regex::find_submatch(std::string_view Text) const
{
   std::vector<std::string> result;
   auto spans = find_submatch_index(Text);
   result.reserve(spans.size());
   for (const auto &span : spans) result.emplace_back(slice(Text, span));
   return result;
}

std::vector<ByteView> Regex::find_submatch(ByteView Bytes) const
{
   std::vector<ByteView> result;
   auto spans = find_submatch_index(as_text(Bytes));
   result.reserve(spans.size());
   for (const auto &span : spans) result.push_back(slice(Bytes, span));
   return result;
}

//********************************************************************************************************************

std::vector<std::vector<CaptureSpan>> Regex::find_all_submatch_index(std::string_view Text, int Limit) const
{
   std::vector<std::vector<CaptureSpan>> result;
   if (not is_ready()) return result;

   impl->for_each_match(normalise(Text), Limit, [&](const std::vector<CaptureSpan> &Spans) {
      result.push_back(Spans);
   });

   return result;
}

std::vector<std::vector<CaptureSpan>> Regex::find_all_submatch_index(ByteView Bytes, int Limit) const
{
   return find_all_submatch_index(as_text(Bytes), Limit);
}

std::vector<CaptureSpan> Regex::find_all_index(std::string_view Text, int Limit) const
{
   std::vector<CaptureSpan> result;
   if (not is_ready()) return result;

   impl->for_each_match(normalise(Text), Limit, [&](const std::vector<CaptureSpan> &Spans) {
      result.push_back(Spans[0]);
   });

   return result;
}

std::vector<CaptureSpan> Regex::find_all_index(ByteView Bytes, int Limit) const
{
   return find_all_index(as_text(Bytes), Limit);
}

std::vector<std::string> Regex::find_all(std::string_view Text, int Limit) const
{
   std::vector<std::string> result;
   for (const auto &span : find_all_index(Text, Limit)) result.emplace_back(slice(Text, span));
   return result;
}

std::vector<ByteView> Regex::find_all(ByteView Bytes, int Limit) const
{
   std::vector<ByteView> result;
   for (const auto &span : find_all_index(as_text(Bytes), Limit)) result.push_back(slice(Bytes, span));
   return result;
}

std::vector<std::vector<std::string>> Regex::find_all_submatch(std::string_view Text, int Limit) const
{
   std::vector<std::vector<std::string>> result;
   for (const auto &spans : find_all_submatch_index(Text, Limit)) {
      auto &captures = result.emplace_back();
      captures.reserve(spans.size());
      for (const auto &span : spans) captures.emplace_back(slice(Text, span));
   }
   return result;
}

std::vector<std::vector<ByteView>> Regex::find_all_submatch(ByteView Bytes, int Limit) const
{
   std::vector<std::vector<ByteView>> result;
   for (const auto &spans : find_all_submatch_index(as_text(Bytes), Limit)) {
      auto &captures = result.emplace_back();
      captures.reserve(spans.size());
      for (const auto &span : spans) captures.push_back(slice(Bytes, span));
   }
   return result;
}

/*********************************************************************************************************************

-METHOD-
expand: Appends a replacement template to Output, with references resolved against a match.

Match is a result of find_submatch_index() or find_all_submatch_index() over Source.  References to groups that do
not exist are copied literally; references to groups that did not participate in the match expand to nothing.

-END-

*********************************************************************************************************************/

void Regex::expand(std::string &Output, std::string_view Template, std::string_view Source, const std::vector<CaptureSpan> &Match) const
{
   auto append_group = [&](size_t Index) {
      if (Index < Match.size()) Output.append(slice(Source, Match[Index]));
   };

   const char *cursor = Template.data();
   const char *const end = cursor + Template.size();

   while (cursor != end) {
      if (*cursor != '$') {
         Output.push_back(*cursor);
         ++cursor;
         continue;
      }

      ++cursor;
      if (cursor IS end) {
         Output.push_back('$');
         break;
      }

      const char marker = *cursor;

      if (marker IS '$') {
         Output.push_back('$');
         ++cursor;
      }
      else if (marker IS '&') {
         append_group(0);
         ++cursor;
      }
      else if ((marker IS '`') and (not Match.empty()) and Match[0].matched()) {
         Output.append(Source.substr(0, Match[0].offset));
         ++cursor;
      }
      else if ((marker IS '\'') and (not Match.empty()) and Match[0].matched()) {
         Output.append(Source.substr(std::min(Match[0].end(), Source.size())));
         ++cursor;
      }
      else if ((marker IS '<') and is_ready()) {
         const char *const lt_position = cursor;
         ++cursor;
         const char *const name_begin = cursor;

         while ((cursor != end) and (*cursor != '>')) ++cursor;

         if (cursor IS end) {
            Output.push_back('$');
            cursor = lt_position;
         }
         else {
            const std::string_view name(name_begin, (size_t)(cursor - name_begin));
            std::vector<int> indices;
            if ((not name.empty()) and impl->pattern.resolve_named_capture(name, indices)) {
               for (auto index : indices) { // Duplicate names resolve to the group that participated
                  if ((index >= 0) and (size_t(index) < Match.size()) and Match[index].matched()) {
                     append_group(size_t(index));
                     break;
                  }
               }
            }
            ++cursor;
         }
      }
      else if ((marker >= '0') and (marker <= '9')) {
         size_t number = (size_t)(marker - '0');
         ++cursor;

         if ((cursor != end) and (*cursor >= '0') and (*cursor <= '9') and (number * 10 + size_t(*cursor - '0') < Match.size())) {
            number = number * 10 + size_t(*cursor - '0');
            ++cursor;
         }

         if (number < Match.size()) append_group(number);
         else {
            Output.push_back('$');
            Output.push_back(marker);
         }
      }
      else {
         Output.push_back('$');
         Output.push_back(marker);
         ++cursor;
      }
   }
}

void Regex::expand(ByteBuffer &Output, ByteView Template, ByteView Source, const std::vector<CaptureSpan> &Match) const
{
   std::string buffer;
   expand(buffer, as_text(Template), as_text(Source), Match);
   Output.insert(Output.end(), buffer.begin(), buffer.end());
}

/*********************************************************************************************************************

-METHOD-
replace_all: Replaces every match in Text with an expansion of Template.

The literal and callback variants follow the same iteration rules; replace_all_literal() copies Replacement without
interpreting `$`, and replace_all_func() substitutes the value returned by Function for each matched text.

-END-

*********************************************************************************************************************/

std::string Regex::replace_all(std::string_view Text, std::string_view Template) const
{
   if (not is_ready()) return std::string(Text);

   Text = normalise(Text);

   std::string result;
   result.reserve(Text.size() + Template.size());
   size_t copy_position = 0;

   impl->for_each_match(Text, -1, [&](const std::vector<CaptureSpan> &Spans) {
      result.append(Text.substr(copy_position, Spans[0].offset - copy_position));
      expand(result, Template, Text, Spans);
      copy_position = Spans[0].end();
   });

   result.append(Text.substr(copy_position));
   return result;
}

ByteBuffer Regex::replace_all(ByteView Bytes, ByteView Template) const
{
   auto result = replace_all(as_text(Bytes), as_text(Template));
   return ByteBuffer(result.begin(), result.end());
}

std::string Regex::replace_all_literal(std::string_view Text, std::string_view Replacement) const
{
   return replace_all_func(Text, [&](std::string_view) { return std::string(Replacement); });
}

ByteBuffer Regex::replace_all_literal(ByteView Bytes, ByteView Replacement) const
{
   auto result = replace_all_literal(as_text(Bytes), as_text(Replacement));
   return ByteBuffer(result.begin(), result.end());
}

std::string Regex::replace_all_func(std::string_view Text, const std::function<std::string(std::string_view)> &Function) const
{
   if ((not is_ready()) or (not Function)) return std::string(Text);

   Text = normalise(Text);

   std::string result;
   result.reserve(Text.size());
   size_t copy_position = 0;

   impl->for_each_match(Text, -1, [&](const std::vector<CaptureSpan> &Spans) {
      result.append(Text.substr(copy_position, Spans[0].offset - copy_position));
      result.append(Function(slice(Text, Spans[0])));
      copy_position = Spans[0].end();
   });

   result.append(Text.substr(copy_position));
   return result;
}

ByteBuffer Regex::replace_all_func(ByteView Bytes, const std::function<ByteBuffer(ByteView)> &Function) const
{
   if ((not is_ready()) or (not Function)) return ByteBuffer(Bytes.begin(), Bytes.end());

   auto text = normalise(as_text(Bytes));

   ByteBuffer result;
   result.reserve(Bytes.size());
   size_t copy_position = 0;

   impl->for_each_match(text, -1, [&](const std::vector<CaptureSpan> &Spans) {
      result.insert(result.end(), Bytes.begin() + copy_position, Bytes.begin() + Spans[0].offset);
      auto replacement = Function(slice(Bytes, Spans[0]));
      result.insert(result.end(), replacement.begin(), replacement.end());
      copy_position = Spans[0].end();
   });

   result.insert(result.end(), Bytes.begin() + copy_position, Bytes.end());
   return result;
}

/*********************************************************************************************************************

-METHOD-
split: Splits Text into the substrings between matches.

A Limit of zero returns no substrings.  A positive Limit returns at most that many, with the unsplit remainder in
the last entry.  A negative Limit returns all substrings.  An empty match at the start of a non-empty Text does not
produce a leading empty substring, so an empty pattern splits Text into individual UTF-8 characters.

-END-

*********************************************************************************************************************/

std::vector<std::string> Regex::split(std::string_view Text, int Limit) const
{
   std::vector<std::string> result;

   if ((Limit IS 0) or (not is_ready())) return result;

   if ((not impl->source.empty()) and Text.empty()) {
      result.emplace_back();
      return result;
   }

   size_t begin = 0;
   size_t end = 0;

   for (const auto &span : find_all_index(Text, Limit)) {
      if ((Limit > 0) and (result.size() IS size_t(Limit - 1))) break;

      end = span.offset;
      if (span.end() != 0) result.emplace_back(Text.substr(begin, end - begin));
      begin = span.end();
   }

   if (end != Text.size()) result.emplace_back(Text.substr(begin));

   return result;
}

//********************************************************************************************************************

std::pair<std::string, bool> Regex::literal_prefix() const
{
   if (not is_ready()) return { std::string(), false };
   return scan_literal_prefix(impl->source, impl->flags);
}

// Returns the number of capturing groups, excluding the complete match.

int Regex::num_subexp() const
{
   if (not is_ready()) return 0;
   return int(impl->pattern.mark_count());
}

std::vector<std::string> Regex::subexp_names() const
{
   std::vector<std::string> names;
   if (not is_ready()) return names;

   const auto total = impl->pattern.mark_count() + 1;
   names.reserve(total);
   names.emplace_back();
   for (unsigned i = 1; i < total; i++) names.push_back(impl->pattern.group_name(i));
   return names;
}

// Returns the index of the first group with the given name, or -1 if there is no such group.

int Regex::subexp_index(std::string_view Name) const
{
   if ((not is_ready()) or Name.empty()) return -1;

   std::vector<int> indices;
   if (impl->pattern.resolve_named_capture(Name, indices) and (not indices.empty())) return indices[0];
   return -1;
}

} // namespace lrx
