#pragma once

// Name:      regex.h
// Copyright: LazyRX authors 2025

#include <lazyrx/main.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lrx {

using ByteView   = std::span<const uint8_t>;
using ByteBuffer = std::vector<uint8_t>;

// Byte range of a match or capture group.  Groups that did not participate in a match have an offset of npos.

struct CaptureSpan {
   size_t offset = std::string::npos;
   size_t length = 0u;

   bool matched() const { return offset != std::string::npos; }
   size_t end() const { return offset + length; }

   bool operator==(const CaptureSpan &) const = default;
};

//********************************************************************************************************************
// Regex is the compiled form of an ECMAScript pattern.  All matching operations are const and safe to call from
// multiple threads; longest() is a configuration step and must be made before the object is shared.
//
// Functions that return multiple matches accept a Limit; a negative value returns all matches.  Successive matches
// never overlap, and an empty match that immediately follows a previous match is ignored.
//
// Replacement templates recognise $$, $&, $` (text before the match), $' (text after the match), $n and $nn (numbered
// groups) and $<name> (named groups).  Any other use of $ is copied literally.
//
// The std::istream forms consume the stream to its end before matching, and report offsets from the position the
// stream was at when the call was made.

class Regex {
public:
   Regex();
   Regex(Regex &&Other) noexcept;
   Regex & operator=(Regex &&Other) noexcept;
   Regex(const Regex &) = delete;
   Regex & operator=(const Regex &) = delete;
   ~Regex();

   ERR compile(std::string_view Pattern, REGEX Flags = REGEX::NIL, std::string *ErrorMsg = nullptr);
   bool is_ready() const;
   const std::string & string() const;

   void longest();

   bool match(std::string_view Text) const;
   bool match(ByteView Bytes) const;
   bool match(std::istream &Input) const;

   std::optional<std::string> find(std::string_view Text) const;
   std::optional<ByteView> find(ByteView Bytes) const;
   std::optional<CaptureSpan> find_index(std::string_view Text) const;
   std::optional<CaptureSpan> find_index(ByteView Bytes) const;
   std::optional<CaptureSpan> find_index(std::istream &Input) const;
   std::vector<std::string> find_submatch(std::string_view Text) const;
   std::vector<ByteView> find_submatch(ByteView Bytes) const;
   std::vector<CaptureSpan> find_submatch_index(std::string_view Text) const;
   std::vector<CaptureSpan> find_submatch_index(ByteView Bytes) const;
   std::vector<CaptureSpan> find_submatch_index(std::istream &Input) const;

   std::vector<std::string> find_all(std::string_view Text, int Limit = -1) const;
   std::vector<ByteView> find_all(ByteView Bytes, int Limit = -1) const;
   std::vector<CaptureSpan> find_all_index(std::string_view Text, int Limit = -1) const;
   std::vector<CaptureSpan> find_all_index(ByteView Bytes, int Limit = -1) const;
   std::vector<std::vector<std::string>> find_all_submatch(std::string_view Text, int Limit = -1) const;
   std::vector<std::vector<ByteView>> find_all_submatch(ByteView Bytes, int Limit = -1) const;
   std::vector<std::vector<CaptureSpan>> find_all_submatch_index(std::string_view Text, int Limit = -1) const;
   std::vector<std::vector<CaptureSpan>> find_all_submatch_index(ByteView Bytes, int Limit = -1) const;

   void expand(std::string &Output, std::string_view Template, std::string_view Source, const std::vector<CaptureSpan> &Match) const;
   void expand(ByteBuffer &Output, ByteView Template, ByteView Source, const std::vector<CaptureSpan> &Match) const;

   std::string replace_all(std::string_view Text, std::string_view Template) const;
   ByteBuffer replace_all(ByteView Bytes, ByteView Template) const;
   std::string replace_all_literal(std::string_view Text, std::string_view Replacement) const;
   ByteBuffer replace_all_literal(ByteView Bytes, ByteView Replacement) const;
   std::string replace_all_func(std::string_view Text, const std::function<std::string(std::string_view)> &Function) const;
   ByteBuffer replace_all_func(ByteView Bytes, const std::function<ByteBuffer(ByteView)> &Function) const;

   std::vector<std::string> split(std::string_view Text, int Limit = -1) const;

   std::pair<std::string, bool> literal_prefix() const;
   int num_subexp() const;
   std::vector<std::string> subexp_names() const;
   int subexp_index(std::string_view Name) const;

private:
   struct Implementation;
   std::unique_ptr<Implementation> impl;
};

} // namespace lrx
