#pragma once

#include <asio/awaitable.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBodyStream - incrementally produced request body
// ─────────────────────────────────────────────────────────────────────────────
// A live source (a pipe, a socket, a generator). Once read it cannot be
// rewound, so a request carrying one is never retried automatically.

class IBodyStream {
public:
    virtual ~IBodyStream() = default;

    /// Next chunk, or nullopt at end of body.
    [[nodiscard]] virtual asio::awaitable<std::optional<std::string>> read_chunk() = 0;
};

/// Chunks supplied up front, handed out once.
class ChunkedBodyStream final : public IBodyStream {
public:
    ChunkedBodyStream() = default;

    explicit ChunkedBodyStream(std::deque<std::string> chunks)
        : chunks_(std::move(chunks)) {}

    void push(std::string chunk) {
        chunks_.push_back(std::move(chunk));
    }

    asio::awaitable<std::optional<std::string>> read_chunk() override {
        if (chunks_.empty()) {
            co_return std::nullopt;
        }
        auto chunk = std::move(chunks_.front());
        chunks_.pop_front();
        co_return chunk;
    }

private:
    std::deque<std::string> chunks_;
};

// ─────────────────────────────────────────────────────────────────────────────
// RequestBody
// ─────────────────────────────────────────────────────────────────────────────

class RequestBody {
public:
    RequestBody() = default;

    RequestBody(std::string content)
        : source_(std::move(content)) {}

    RequestBody(const char* content)
        : source_(std::string(content)) {}

    RequestBody(std::shared_ptr<IBodyStream> stream)
        : source_(std::move(stream)) {}

    [[nodiscard]] bool empty() const {
        return std::holds_alternative<std::monostate>(source_);
    }

    [[nodiscard]] bool is_stream() const {
        return std::holds_alternative<std::shared_ptr<IBodyStream>>(source_);
    }

    /// Buffered bodies can be sent again on a later attempt; streams cannot.
    [[nodiscard]] bool is_replayable() const {
        return is_stream() == false;
    }

    /// Buffered content; empty for no body or a stream.
    [[nodiscard]] const std::string& content() const {
        static const std::string empty_content;
        const auto* text = std::get_if<std::string>(&source_);
        return (text != nullptr) ? *text : empty_content;
    }

    [[nodiscard]] std::shared_ptr<IBodyStream> stream() const {
        const auto* stream = std::get_if<std::shared_ptr<IBodyStream>>(&source_);
        return (stream != nullptr) ? *stream : nullptr;
    }

private:
    std::variant<std::monostate, std::string, std::shared_ptr<IBodyStream>> source_;
};

}  // namespace fetchpp
