/*********************************************************************************************************************

Tests for the compiled Regex engine

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/regex.h>
#include <lazyrx/strings.hpp>

#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

struct TestContext {
   int total_checks{0};
   int failed_checks{0};

   void expect_true(bool Condition, char const *Message) {
      total_checks += 1;
      if (not Condition) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << '\n';
      }
   }

   void expect_false(bool Condition, char const *Message) {
      total_checks += 1;
      if (Condition) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << '\n';
      }
   }

   template<typename T, typename U>
   void expect_equal(T const &Actual, U const &Expected, char const *Message) {
      total_checks += 1;
      if (not (Actual IS Expected)) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << " (actual=" << Actual << ", expected=" << Expected << ")\n";
      }
   }

   void summary() const {
      if (failed_checks IS 0) {
         std::cout << "All " << total_checks << " checks passed." << '\n';
      } else {
         std::cout << failed_checks << " of " << total_checks << " checks failed." << '\n';
      }
   }
};

static lrx::ByteView bytes(std::string_view Text)
{
   return lrx::ByteView((const uint8_t *)Text.data(), Text.size());
}

static lrx::Regex make(std::string_view Pattern, REGEX Flags = REGEX::NIL)
{
   lrx::Regex rx;
   rx.compile(Pattern, Flags);
   return rx;
}

//********************************************************************************************************************

void test_compile(TestContext &Context) {
   lrx::Regex rx;
   Context.expect_false(rx.is_ready(), "Uncompiled regex is not ready");
   Context.expect_false(rx.match("abc"), "Uncompiled regex does not match");

   Context.expect_true(rx.compile("a+") IS ERR::Okay, "Valid pattern compiles");
   Context.expect_true(rx.is_ready(), "Compiled regex is ready");
   Context.expect_equal(rx.string(), std::string("a+"), "string() returns the source pattern");

   std::string error_msg;
   lrx::Regex bad;
   Context.expect_true(bad.compile("(abc", REGEX::NIL, &error_msg) IS ERR::Syntax, "Unbalanced group fails to compile");
   Context.expect_false(error_msg.empty(), "Compilation failure provides a message");
   Context.expect_false(bad.is_ready(), "Failed regex is not ready");
   Context.expect_false(bad.match("abc"), "Failed regex does not match");
   Context.expect_true(bad.find_submatch("abc").empty(), "Failed regex returns no submatches");
}

void test_match_and_find(TestContext &Context) {
   auto rx = make("a+");
   Context.expect_true(rx.match("xaay"), "Search finds a match anywhere in the text");
   Context.expect_false(rx.match("xyz"), "No match returns false");

   auto found = rx.find("xaay");
   Context.expect_true(found.has_value() and (*found IS "aa"), "find() returns the leftmost match");
   Context.expect_false(rx.find("xyz").has_value(), "find() returns nothing if there is no match");

   auto index = rx.find_index("xaay");
   Context.expect_true(index.has_value() and (index->offset IS 1) and (index->length IS 2), "find_index() returns offset and length");

   auto empty = make("x*").find("abc");
   Context.expect_true(empty.has_value() and empty->empty(), "An empty match is distinct from no match");

   auto icase = make("ABC", REGEX::ICASE);
   Context.expect_true(icase.match("xabcx"), "ICASE ignores case");

   Context.expect_false(make("^b").match("a\nb"), "^ anchors to the start of the text by default");
   Context.expect_true(make("^b", REGEX::MULTILINE).match("a\nb"), "MULTILINE anchors ^ to line starts");
   Context.expect_false(make("a.b").match("a\nb"), ". does not match a new line by default");
   Context.expect_true(make("a.b", REGEX::DOT_ALL).match("a\nb"), "DOT_ALL allows . to match a new line");
}

void test_submatches(TestContext &Context) {
   auto rx = make("([0-9]+)\\.([0-9]+)\\.([0-9]+)");
   auto groups = rx.find_submatch("1.2.3");
   Context.expect_true(groups IS std::vector<std::string>({ "1.2.3", "1", "2", "3" }), "Submatches include the full match and each group");

   auto version = rx.find_submatch("version 10.20.30 released");
   Context.expect_true((version.size() IS 4) and (version[1] IS "10") and (version[3] IS "30"), "Submatches are found mid-text");

   auto alt = make("(a)|(b)");
   auto spans = alt.find_submatch_index("b");
   Context.expect_equal(spans.size(), size_t(3), "Every group has an entry");
   Context.expect_false(spans[1].matched(), "Non-participating group is unmatched");
   Context.expect_true(spans[2].matched() and (spans[2].offset IS 0) and (spans[2].length IS 1), "Participating group has its span");

   Context.expect_true(rx.find_submatch("no digits").empty(), "No match returns an empty list");
}

void test_find_all(TestContext &Context) {
   auto rx = make("a");
   Context.expect_equal(rx.find_all("banana").size(), size_t(3), "All matches are returned");
   Context.expect_equal(rx.find_all("banana", 2).size(), size_t(2), "Limit caps the number of matches");
   Context.expect_true(rx.find_all("banana", 0).empty(), "Zero limit returns no matches");

   auto stars = make("a*").find_all("baaac");
   Context.expect_true(stars IS std::vector<std::string>({ "", "aaa", "" }), "Empty match adjacent to a previous match is skipped");

   auto index = make("o+").find_all_index("foo boo");
   Context.expect_true((index.size() IS 2) and (index[0] IS lrx::CaptureSpan{ 1, 2 }) and (index[1] IS lrx::CaptureSpan{ 5, 2 }), "Match indices are reported in order");

   auto pairs = make("(\\w)=(\\d)").find_all_submatch("a=1, b=2, c=x");
   Context.expect_equal(pairs.size(), size_t(2), "All submatches are returned");
   Context.expect_true((pairs[1][1] IS "b") and (pairs[1][2] IS "2"), "Each submatch holds its groups");

   auto pair_index = make("(\\w)=(\\d)").find_all_submatch_index("a=1, b=2", 1);
   Context.expect_true((pair_index.size() IS 1) and (pair_index[0][2] IS lrx::CaptureSpan{ 2, 1 }), "Submatch indices honour Limit");

   auto utf8 = make("").find_all("\xc3\xa9");
   Context.expect_equal(utf8.size(), size_t(2), "Empty matches advance by whole UTF-8 characters");

   auto invalid = make("x*").find_all("\x80\x80");
   Context.expect_equal(invalid.size(), size_t(3), "Empty matches advance one byte at a time over invalid UTF-8");
}

void test_utf8_length(TestContext &Context) {
   Context.expect_equal(lrx::utf8_char_length("a"), size_t(1), "ASCII is one byte");
   Context.expect_equal(lrx::utf8_char_length("\xc3\xa9x"), size_t(2), "Two byte sequence");
   Context.expect_equal(lrx::utf8_char_length("\xe2\x84\xaa"), size_t(3), "Three byte sequence");
   Context.expect_equal(lrx::utf8_char_length("\x80\x80\x80"), size_t(1), "Stray continuation bytes are counted singly");
   Context.expect_equal(lrx::utf8_char_length("\xe2\x84"), size_t(1), "Truncated sequence counts as one byte");
   Context.expect_equal(lrx::utf8_char_length("\xc3\xa9\xa9"), size_t(2), "Trailing continuation bytes belong to the next character");
   Context.expect_equal(lrx::utf8_char_length(""), size_t(0), "Empty text has no character");
}

void test_replace(TestContext &Context) {
   auto rx = make("a(x*)b");
   Context.expect_equal(rx.replace_all("-ab-axxb-", "T"), std::string("-T-T-"), "Plain template replaces each match");
   Context.expect_equal(rx.replace_all("-ab-axxb-", "$1"), std::string("--xx-"), "$1 expands the first group");
   Context.expect_equal(rx.replace_all("-ab-axxb-", "[$&]"), std::string("-[ab]-[axxb]-"), "$& expands the full match");
   Context.expect_equal(rx.replace_all("-ab-axxb-", "$$"), std::string("-$-$-"), "$$ produces a dollar sign");
   Context.expect_equal(rx.replace_all("-ab-axxb-", "$9"), std::string("-$9-$9-"), "Reference to a missing group is literal");
   Context.expect_equal(rx.replace_all_literal("-ab-axxb-", "$1"), std::string("-$1-$1-"), "Literal replacement does not expand");
   Context.expect_equal(rx.replace_all("no match", "T"), std::string("no match"), "Text without a match is unchanged");

   auto upper = make("[a-z]+").replace_all_func("abc 123 def", [](std::string_view Match) {
      std::string out(Match);
      for (auto &c : out) c = std::toupper((unsigned char)c);
      return out;
   });
   Context.expect_equal(upper, std::string("ABC 123 DEF"), "Callback replacement receives each match");

   auto named = make("(?<key>\\w+):\\s+(?<value>\\w+)");
   std::string output;
   std::string_view source("option1: value1");
   named.expand(output, "$<key>=$<value>", source, named.find_submatch_index(source));
   Context.expect_equal(output, std::string("option1=value1"), "Named groups expand in templates");

   auto raw = make("o").replace_all(bytes("foo"), bytes("0"));
   Context.expect_true(std::string(raw.begin(), raw.end()) IS "f00", "Byte replacement produces a byte buffer");
}

void test_split(TestContext &Context) {
   auto split_a = make("a").split("banana");
   Context.expect_true(split_a IS std::vector<std::string>({ "b", "n", "n", "" }), "Split produces the text between matches");

   auto split_z = make("z+").split("pizza");
   Context.expect_true(split_z IS std::vector<std::string>({ "pi", "a" }), "Split removes the separators");

   auto limited = make("a*").split("abaabaccadaaae", 5);
   Context.expect_true(limited IS std::vector<std::string>({ "", "b", "b", "c", "cadaaae" }), "Positive limit leaves the remainder unsplit");

   Context.expect_true(make("a").split("banana", 0).empty(), "Zero limit returns nothing");

   auto chars = make("").split("abc");
   Context.expect_true(chars IS std::vector<std::string>({ "a", "b", "c" }), "Empty pattern splits into characters");

   auto empty = make(",").split("");
   Context.expect_true(empty IS std::vector<std::string>({ "" }), "Empty text produces a single empty string");
}

void test_introspection(TestContext &Context) {
   auto rx = make("(a)(?<name>b)");
   Context.expect_equal(rx.num_subexp(), 2, "Group count excludes the full match");
   Context.expect_true(rx.subexp_names() IS std::vector<std::string>({ "", "", "name" }), "Unnamed groups have empty names");
   Context.expect_equal(rx.subexp_index("name"), 2, "Named group is resolved to its index");
   Context.expect_equal(rx.subexp_index("missing"), -1, "Unknown name returns -1");

   auto full = make("abc").literal_prefix();
   Context.expect_true((full.first IS "abc") and full.second, "Literal pattern is its own complete prefix");

   auto partial = make("ab*c").literal_prefix();
   Context.expect_true((partial.first IS "a") and (not partial.second), "Optional atom ends the prefix");

   auto plus = make("abc+").literal_prefix();
   Context.expect_true((plus.first IS "abc") and (not plus.second), "Repeated atom is part of the prefix");

   auto escaped = make("a\\.b").literal_prefix();
   Context.expect_true((escaped.first IS "a.b") and escaped.second, "Escaped punctuation is literal");

   auto alternation = make("ab|ac").literal_prefix();
   Context.expect_true(alternation.first.empty() and (not alternation.second), "Top-level alternation has no prefix");

   auto icase = make("abc", REGEX::ICASE).literal_prefix();
   Context.expect_true(icase.first.empty(), "Case-insensitive pattern has no prefix");
}

void test_longest(TestContext &Context) {
   auto rx = make("a(|b)");
   auto first = rx.find("ab");
   Context.expect_true(first.has_value() and (*first IS "a"), "Default matching prefers the first alternative");

   rx.longest();
   auto longest = rx.find("ab");
   Context.expect_true(longest.has_value() and (*longest IS "ab"), "Leftmost-longest extends the match");

   auto groups = rx.find_submatch("xab");
   Context.expect_true((groups.size() IS 2) and (groups[0] IS "ab") and (groups[1] IS "b"), "Leftmost-longest updates groups");

   auto boundary = make("a|ab\\b");
   boundary.longest();
   auto cut_word = boundary.find("abc");
   Context.expect_true(cut_word.has_value() and (*cut_word IS "a"), "\\b sees the word character after a shorter candidate");
   auto real_word = boundary.find("ab c");
   Context.expect_true(real_word.has_value() and (*real_word IS "ab"), "\\b before a space extends the match");

   auto non_boundary = make("a|ab\\B");
   non_boundary.longest();
   auto inner = non_boundary.find("abc");
   Context.expect_true(inner.has_value() and (*inner IS "ab"), "\\B inside a word extends the match");

   auto eol = make("a|ab$");
   eol.longest();
   auto not_end = eol.find("abc");
   Context.expect_true(not_end.has_value() and (*not_end IS "a"), "$ does not match before the end of the text");

   auto negative = make("a+(?!b)");
   negative.longest();
   auto before_b = negative.find("aab");
   Context.expect_true(before_b.has_value() and (*before_b IS "a"), "Negative lookahead sees the text after a shorter candidate");

   auto at_end = make("a|a+(?!b)");
   at_end.longest();
   auto whole = at_end.find("aaa");
   Context.expect_true(whole.has_value() and (*whole IS "aaa"), "A lookahead pattern still extends to the end of the text");

   auto unready = make("(broken");
   unready.longest();
   Context.expect_false(unready.match("broken"), "longest() leaves an uncompiled regex unusable");
}

void test_streams(TestContext &Context) {
   auto rx = make("(\\d+)\\.(\\d+)");

   std::istringstream text("version 12.4 released");
   Context.expect_true(rx.match(text), "Stream input is matched");

   std::istringstream none("no numbers");
   Context.expect_false(rx.match(none), "Stream without a match");

   std::istringstream indexed("v 3.14");
   auto span = rx.find_index(indexed);
   Context.expect_true(span.has_value() and (*span IS lrx::CaptureSpan{ 2, 4 }), "Stream index of the match");

   std::istringstream partial("skip:7.1");
   partial.ignore(5);
   auto groups = rx.find_submatch_index(partial);
   Context.expect_true((groups.size() IS 3) and (groups[0] IS lrx::CaptureSpan{ 0, 3 }) and (groups[2] IS lrx::CaptureSpan{ 2, 1 }),
      "Stream offsets are relative to the current position");
}

void test_bytes(TestContext &Context) {
   std::string text("key=value");
   auto input = bytes(text);
   auto rx = make("=(\\w+)");

   Context.expect_true(rx.match(input), "Byte input is matched");

   auto found = rx.find(input);
   Context.expect_true(found.has_value() and (found->data() IS input.data() + 3) and (found->size() IS 6), "Byte results refer to the input buffer");

   auto groups = rx.find_submatch(input);
   Context.expect_true((groups.size() IS 2) and (groups[1].data() IS input.data() + 4), "Byte groups refer to the input buffer");

   auto all = make("[a-z]+").find_all(input);
   Context.expect_equal(all.size(), size_t(2), "Byte find_all returns each match");
}

int main() {
   TestContext test_context;
   test_compile(test_context);
   test_match_and_find(test_context);
   test_submatches(test_context);
   test_find_all(test_context);
   test_utf8_length(test_context);
   test_replace(test_context);
   test_split(test_context);
   test_introspection(test_context);
   test_longest(test_context);
   test_streams(test_context);
   test_bytes(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
