#pragma once

// Name:      deferred.h
// Copyright: LazyRX authors 2025

#include <lazyrx/main.h>
#include <lazyrx/errors.h>
#include <lazyrx/log.h>
#include <lazyrx/marshal.h>
#include <lazyrx/regex.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lrx {

//********************************************************************************************************************
// Deferred holds the source of a regular expression and compiles it on first use.  Every matching operation of the
// Engine is available and behaves identically; the first call from any thread performs the one and only
// compilation while concurrent callers wait for it to complete.
//
// Pattern and Flags may be assigned freely until the first operation is made.  After that they are inert: the
// compiled engine is never rebuilt.  A pattern that fails to compile is logged once and raises RegexError on every
// use, including after Pattern is reassigned.
//
// The text and flag marshaling methods read and write Pattern only and never compile it.  This allows a Deferred to
// be declared as a configuration value and loaded by lrx::Config or lrx::ArgParser without any compilation cost.

template <class Engine>
class Deferred {
   private:
      mutable std::once_flag compiled_once;
      mutable std::unique_ptr<Engine> compiled;
      mutable std::optional<RegexError> failure;

      // Returns the compiled engine, compiling Pattern if this is the first use.  The outcome of the first
      // compilation is final: a failure is raised again on every later use.

      const Engine & engine() const {
         std::call_once(compiled_once, [this]() {
            auto instance = std::make_unique<Engine>();
            std::string error_msg;
            if (auto error = instance->compile(Pattern, Flags, &error_msg); error != ERR::Okay) {
               Log log("Deferred");
               log.error("Pattern '%s' is invalid: %s", Pattern.c_str(), error_msg.c_str());
               failure.emplace(error, Pattern, error_msg);
            }
            else compiled = std::move(instance);
         });

         if (failure) throw *failure;
         return *compiled;
      }

   public:
      std::string Pattern;
      REGEX Flags = REGEX::NIL;

      Deferred() = default;
      explicit Deferred(std::string_view Source, REGEX Options = REGEX::NIL) : Pattern(Source), Flags(Options) { }

      Deferred(const Deferred &) = delete;
      Deferred & operator=(const Deferred &) = delete;

      // Compiles the pattern if it has not been compiled already.  Unlike the matching operations this does not
      // raise RegexError; the failure of the first compilation is returned with the engine's message in ErrorMsg.

      ERR compile(std::string *ErrorMsg = nullptr) const {
         try {
            engine();
            return ERR::Okay;
         }
         catch (const RegexError &Error) {
            if (ErrorMsg) *ErrorMsg = Error.detail();
            return Error.code();
         }
      }

      // Marshaling

      ERR marshal_text(ByteBuffer &Output) const {
         Output.assign(Pattern.begin(), Pattern.end());
         return ERR::Okay;
      }

      ERR unmarshal_text(ByteView Input) {
         Pattern.assign((const char *)Input.data(), Input.size());
         return ERR::Okay;
      }

      ERR unmarshal_text(std::string_view Input) {
         Pattern.assign(Input);
         return ERR::Okay;
      }

      ERR marshal_flag(std::string &Output) const {
         Output = Pattern;
         return ERR::Okay;
      }

      ERR unmarshal_flag(std::string_view Input) {
         Pattern.assign(Input);
         return ERR::Okay;
      }

      // Matching

      const std::string & string() const { return engine().string(); }

      // Switches the engine to leftmost-longest matching.  Not safe while other threads are matching.

      void longest() {
         engine();
         compiled->longest();
      }

      bool match(std::string_view Text) const { return engine().match(Text); }
      bool match(ByteView Bytes) const { return engine().match(Bytes); }
      bool match(std::istream &Input) const { return engine().match(Input); }

      std::optional<std::string> find(std::string_view Text) const { return engine().find(Text); }
      std::optional<ByteView> find(ByteView Bytes) const { return engine().find(Bytes); }
      std::optional<CaptureSpan> find_index(std::string_view Text) const { return engine().find_index(Text); }
      std::optional<CaptureSpan> find_index(ByteView Bytes) const { return engine().find_index(Bytes); }
      std::optional<CaptureSpan> find_index(std::istream &Input) const { return engine().find_index(Input); }
      std::vector<std::string> find_submatch(std::string_view Text) const { return engine().find_submatch(Text); }
      std::vector<ByteView> find_submatch(ByteView Bytes) const { return engine().find_submatch(Bytes); }
      std::vector<CaptureSpan> find_submatch_index(std::string_view Text) const { return engine().find_submatch_index(Text); }
      std::vector<CaptureSpan> find_submatch_index(ByteView Bytes) const { return engine().find_submatch_index(Bytes); }
      std::vector<CaptureSpan> find_submatch_index(std::istream &Input) const { return engine().find_submatch_index(Input); }

      std::vector<std::string> find_all(std::string_view Text, int Limit = -1) const {
         return engine().find_all(Text, Limit);
      }

      std::vector<ByteView> find_all(ByteView Bytes, int Limit = -1) const {
         return engine().find_all(Bytes, Limit);
      }

      std::vector<CaptureSpan> find_all_index(std::string_view Text, int Limit = -1) const {
         return engine().find_all_index(Text, Limit);
      }

      std::vector<CaptureSpan> find_all_index(ByteView Bytes, int Limit = -1) const {
         return engine().find_all_index(Bytes, Limit);
      }

      std::vector<std::vector<std::string>> find_all_submatch(std::string_view Text, int Limit = -1) const {
         return engine().find_all_submatch(Text, Limit);
      }

      std::vector<std::vector<ByteView>> find_all_submatch(ByteView Bytes, int Limit = -1) const {
         return engine().find_all_submatch(Bytes, Limit);
      }

      std::vector<std::vector<CaptureSpan>> find_all_submatch_index(std::string_view Text, int Limit = -1) const {
         return engine().find_all_submatch_index(Text, Limit);
      }

      std::vector<std::vector<CaptureSpan>> find_all_submatch_index(ByteView Bytes, int Limit = -1) const {
         return engine().find_all_submatch_index(Bytes, Limit);
      }

      // Replacement

      void expand(std::string &Output, std::string_view Template, std::string_view Source, const std::vector<CaptureSpan> &Match) const {
         engine().expand(Output, Template, Source, Match);
      }

      void expand(ByteBuffer &Output, ByteView Template, ByteView Source, const std::vector<CaptureSpan> &Match) const {
         engine().expand(Output, Template, Source, Match);
      }

      std::string replace_all(std::string_view Text, std::string_view Template) const {
         return engine().replace_all(Text, Template);
      }

      ByteBuffer replace_all(ByteView Bytes, ByteView Template) const {
         return engine().replace_all(Bytes, Template);
      }

      std::string replace_all_literal(std::string_view Text, std::string_view Replacement) const {
         return engine().replace_all_literal(Text, Replacement);
      }

      ByteBuffer replace_all_literal(ByteView Bytes, ByteView Replacement) const {
         return engine().replace_all_literal(Bytes, Replacement);
      }

      std::string replace_all_func(std::string_view Text, const std::function<std::string(std::string_view)> &Function) const {
         return engine().replace_all_func(Text, Function);
      }

      ByteBuffer replace_all_func(ByteView Bytes, const std::function<ByteBuffer(ByteView)> &Function) const {
         return engine().replace_all_func(Bytes, Function);
      }

      std::vector<std::string> split(std::string_view Text, int Limit = -1) const { return engine().split(Text, Limit); }

      // Introspection

      std::pair<std::string, bool> literal_prefix() const { return engine().literal_prefix(); }
      int num_subexp() const { return engine().num_subexp(); }
      std::vector<std::string> subexp_names() const { return engine().subexp_names(); }
      int subexp_index(std::string_view Name) const { return engine().subexp_index(Name); }
};

using DeferredRegex = Deferred<Regex>;

extern template class Deferred<Regex>;

} // namespace lrx
