// MIT License

// Copyright (c) 2023 Kevin Joseph

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
#include "result_codec.hpp"

#include <cstring>
#include <fmt/core.h>
#include <type_traits>

namespace forklift {

namespace {

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    auto appendValue(std::string& bytes, T value) -> void
    {
        bytes.append(reinterpret_cast<char const*>(&value), sizeof(T));
    }

    auto appendField(std::string& bytes, std::string const& field) -> void
    {
        appendValue<uint64_t>(bytes, field.size());
        bytes.append(field);
    }

    struct Reader {
        std::string_view remaining;

        template <typename T>
            requires std::is_trivially_copyable_v<T>
        auto ReadValue(char const* what) -> std::expected<T, ForkliftError>
        {
            if (remaining.size() < sizeof(T)) {
                return std::unexpected(truncated(what, sizeof(T)));
            }
            T value {};
            std::memcpy(&value, remaining.data(), sizeof(T));
            remaining.remove_prefix(sizeof(T));
            return value;
        }

        auto ReadField(char const* what) -> std::expected<std::string, ForkliftError>
        {
            auto length = ReadValue<uint64_t>(what);
            if (not length.has_value()) {
                return std::unexpected(length.error());
            }
            if (remaining.size() < *length) {
                return std::unexpected(truncated(what, *length));
            }
            std::string field(remaining.substr(0, *length));
            remaining.remove_prefix(*length);
            return field;
        }

    private:
        auto truncated(char const* what, uint64_t needed) const -> ForkliftError
        {
            return ForkliftError { .error_type = ForkliftErrorType::CodecError,
                .error_message = fmt::format(
                    "truncated {}: need {} bytes, {} left", what, needed, remaining.size()) };
        }
    };

} // namespace

auto EncodeJobOutcomes(std::vector<JobOutcome> const& outcomes) -> std::string
{
    std::string bytes;
    appendValue<uint32_t>(bytes, RESULT_CODEC_MAGIC);
    appendValue<uint64_t>(bytes, outcomes.size());
    for (auto const& outcome : outcomes) {
        appendValue<uint8_t>(bytes, outcome.success ? 1 : 0);
        appendField(bytes, outcome.error);
        appendField(bytes, outcome.data);
    }
    return bytes;
}

auto DecodeJobOutcomes(std::string_view bytes)
    -> std::expected<std::vector<JobOutcome>, ForkliftError>
{
    Reader reader { bytes };
    auto magic = reader.ReadValue<uint32_t>("magic");
    if (not magic.has_value()) {
        return std::unexpected(magic.error());
    }
    if (*magic != RESULT_CODEC_MAGIC) {
        return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::CodecError,
            .error_message = fmt::format("bad magic {:#x}", *magic) });
    }
    auto count = reader.ReadValue<uint64_t>("count");
    if (not count.has_value()) {
        return std::unexpected(count.error());
    }

    std::vector<JobOutcome> outcomes;
    for (uint64_t index = 0; index < *count; ++index) {
        auto success = reader.ReadValue<uint8_t>("success flag");
        if (not success.has_value()) {
            return std::unexpected(success.error());
        }
        auto error = reader.ReadField("error");
        if (not error.has_value()) {
            return std::unexpected(error.error());
        }
        auto data = reader.ReadField("data");
        if (not data.has_value()) {
            return std::unexpected(data.error());
        }
        outcomes.push_back(JobOutcome {
            .success = *success != 0, .error = std::move(*error), .data = std::move(*data) });
    }
    if (not reader.remaining.empty()) {
        return std::unexpected(ForkliftError { .error_type = ForkliftErrorType::CodecError,
            .error_message = fmt::format(
                "{} trailing bytes after {} outcomes", reader.remaining.size(), *count) });
    }
    return outcomes;
}

} // namespace forklift
