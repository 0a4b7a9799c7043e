/*********************************************************************************************************************

Tests for Config parsing and DeferredRegex loading

*********************************************************************************************************************/

#include <lazyrx/main.h>
#include <lazyrx/config.h>
#include <lazyrx/deferred.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

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

static std::atomic<int> glCompiles{0};

struct CountingRegex : public lrx::Regex {
   ERR compile(std::string_view Pattern, REGEX Flags, std::string *ErrorMsg) {
      glCompiles++;
      return lrx::Regex::compile(Pattern, Flags, ErrorMsg);
   }
};

static const char glScannerConfig[] =
"# Patterns used by the log scanner\n"
"ignored = before any group\n"
"\n"
"[Scanner]\n"
"Version = ([0-9]+)\\.([0-9]+)\\.([0-9]+)\n"
"Name    =   release   \n"
"Quoted  = \"  padded  \"\n"
"\n"
"[Output]\n"
"# Comment inside a group\n"
"Format=$1-$2\n"
"Empty =\n";

//********************************************************************************************************************

void test_parse(TestContext &Context) {
   lrx::Config cfg;
   Context.expect_true(cfg.parse(glScannerConfig) IS ERR::Okay, "Config text is parsed");
   Context.expect_equal(cfg.total_groups(), size_t(2), "Both groups are found");
   Context.expect_equal(cfg.total_keys(), size_t(5), "All keys are found");

   std::string value;
   Context.expect_true(cfg.read("Scanner", "Name", value) IS ERR::Okay, "Key is read");
   Context.expect_equal(value, std::string("release"), "Value whitespace is trimmed");

   cfg.read("Scanner", "Quoted", value);
   Context.expect_equal(value, std::string("\"  padded  \""), "Quotes are kept by default");

   cfg.read("Output", "Format", value);
   Context.expect_equal(value, std::string("$1-$2"), "Key without spaces around = is read");

   Context.expect_true(cfg.read("Output", "Empty", value) IS ERR::Okay, "Key with an empty value is read");
   Context.expect_true(value.empty(), "Empty value is empty");

   Context.expect_true(cfg.read("Scanner", "Missing", value) IS ERR::Search, "Missing key returns ERR::Search");
   Context.expect_true(cfg.read("Missing", "Name", value) IS ERR::Search, "Missing group returns ERR::Search");
   Context.expect_true(cfg.read("", "ignored", value) IS ERR::Search, "Keys before the first group are ignored");

   lrx::Config empty;
   Context.expect_true(empty.parse("") IS ERR::NoData, "Empty text returns ERR::NoData");
}

void test_strip_quotes(TestContext &Context) {
   lrx::Config cfg(CNF::STRIP_QUOTES);
   cfg.parse(glScannerConfig);

   std::string value;
   cfg.read("Scanner", "Quoted", value);
   Context.expect_equal(value, std::string("  padded  "), "STRIP_QUOTES removes quotes and keeps whitespace");
}

void test_deferred_loading(TestContext &Context) {
   glCompiles = 0;

   lrx::Config cfg;
   cfg.parse(glScannerConfig);

   lrx::Deferred<CountingRegex> version{"unset"};
   Context.expect_true(cfg.read("Scanner", "Version", version) IS ERR::Okay, "Pattern is read into a DeferredRegex");
   Context.expect_equal(version.Pattern, std::string("([0-9]+)\\.([0-9]+)\\.([0-9]+)"), "Pattern text is loaded verbatim");
   Context.expect_equal(glCompiles.load(), 0, "Loading a pattern does not compile it");

   auto groups = version.find_submatch("1.2.3");
   Context.expect_true((groups.size() IS 4) and (groups[3] IS "3"), "Loaded pattern is used on first match");
   Context.expect_equal(glCompiles.load(), 1, "Pattern is compiled on first use");

   lrx::Deferred<CountingRegex> missing{"default"};
   Context.expect_true(cfg.read("Scanner", "Missing", missing) IS ERR::Search, "Missing key leaves the pattern alone");
   Context.expect_equal(missing.Pattern, std::string("default"), "Default pattern is kept");

   lrx::DeferredRegex broken;
   Context.expect_true(cfg.read("Output", "Format", broken) IS ERR::Okay, "Any text can be loaded as a pattern");
}

void test_write(TestContext &Context) {
   lrx::Config cfg(CNF::STRIP_QUOTES);
   lrx::DeferredRegex filter{"^(warn|error):"};

   Context.expect_true(cfg.write("Filters", "Level", filter) IS ERR::Okay, "DeferredRegex is written");
   Context.expect_true(cfg.write("Filters", "Padded", " x ") IS ERR::Okay, "String is written");
   Context.expect_true(cfg.write("", "Key", "value") IS ERR::NullArgs, "Empty group is rejected");

   auto text = cfg.serialise();

   lrx::Config reloaded(CNF::STRIP_QUOTES);
   Context.expect_true(reloaded.parse(text) IS ERR::Okay, "Serialised text is parsed");

   lrx::DeferredRegex loaded;
   reloaded.read("Filters", "Level", loaded);
   Context.expect_equal(loaded.Pattern, filter.Pattern, "Pattern survives serialisation");
   Context.expect_true(loaded.match("error: disk full"), "Reloaded pattern matches");

   std::string padded;
   reloaded.read("Filters", "Padded", padded);
   Context.expect_equal(padded, std::string(" x "), "Padded value survives serialisation");
}

void test_load(TestContext &Context) {
   const std::string path("test_config_load.cfg");

   {
      std::ofstream file(path, std::ios::out | std::ios::trunc);
      file << glScannerConfig;
   }

   lrx::Config cfg;
   Context.expect_true(cfg.load(path) IS ERR::Okay, "Config file is loaded");

   lrx::DeferredRegex version;
   cfg.read("Scanner", "Version", version);
   Context.expect_true(version.match("v10.0.1"), "Pattern from the file is usable");

   std::remove(path.c_str());

   lrx::Config missing;
   Context.expect_true(missing.load("does/not/exist.cfg") IS ERR::File, "Missing file returns ERR::File");
}

int main() {
   TestContext test_context;
   test_parse(test_context);
   test_strip_quotes(test_context);
   test_deferred_loading(test_context);
   test_write(test_context);
   test_load(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
