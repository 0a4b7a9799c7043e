#pragma once

// Name:      marshal.h
// Copyright: LazyRX authors 2025

#include <lazyrx/main.h>

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lrx {

//********************************************************************************************************************
// Value conversion contracts.  Text marshalers are used by structured configuration readers (lrx::Config) and flag
// marshalers by command-line readers (lrx::ArgParser).  Both report errors as ERR codes.

template<typename T>
concept TextMarshaler = requires(const T &Value, std::vector<uint8_t> &Output) {
   { Value.marshal_text(Output) } -> std::same_as<ERR>;
};

template<typename T>
concept TextUnmarshaler = requires(T &Value, std::span<const uint8_t> Input) {
   { Value.unmarshal_text(Input) } -> std::same_as<ERR>;
};

template<typename T>
concept FlagMarshaler = requires(const T &Value, std::string &Output) {
   { Value.marshal_flag(Output) } -> std::same_as<ERR>;
};

template<typename T>
concept FlagUnmarshaler = requires(T &Value, std::string_view Input) {
   { Value.unmarshal_flag(Input) } -> std::same_as<ERR>;
};

} // namespace lrx
