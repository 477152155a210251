#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace execbox::execution {

class LineSource {
public:
    virtual ~LineSource() = default;
    // Blocks until the next line is available; nullopt once exhausted.
    virtual std::optional<std::string> Next() = 0;
    // Called when the consumer abandons the stream before exhaustion.
    virtual void Cancel() = 0;
};

// Single-use, forward-only sequence of output lines. Dropping a stream that
// has not been read to the end cancels its producer.
class LineStream {
public:
    explicit LineStream(std::unique_ptr<LineSource> source);
    ~LineStream();

    LineStream(LineStream&& other) noexcept;
    LineStream& operator=(LineStream&& other) noexcept;
    LineStream(const LineStream&) = delete;
    LineStream& operator=(const LineStream&) = delete;

    static LineStream FromLines(std::vector<std::string> lines);

    std::optional<std::string> Next();
    std::vector<std::string> Collect();
    bool finished() const { return finished_; }

private:
    void Abandon() noexcept;

    std::unique_ptr<LineSource> source_;
    bool finished_ = false;
};

// Splits a chunked byte stream into lines without their trailing newline.
class LineSplitter {
public:
    std::vector<std::string> Feed(const std::string& data);
    std::optional<std::string> Flush();

private:
    std::string partial_;
};

}  // namespace execbox::execution
