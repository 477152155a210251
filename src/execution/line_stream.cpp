#include "execution/line_stream.hpp"

#include <deque>
#include <exception>

#include "utils/logging.hpp"

namespace execbox::execution {
namespace {

class VectorLineSource : public LineSource {
public:
    explicit VectorLineSource(std::vector<std::string> lines)
        : lines_(lines.begin(), lines.end()) {}

    std::optional<std::string> Next() override {
        if (lines_.empty()) {
            return std::nullopt;
        }
        auto line = std::move(lines_.front());
        lines_.pop_front();
        return line;
    }

    void Cancel() override { lines_.clear(); }

private:
    std::deque<std::string> lines_;
};

}  // namespace

LineStream::LineStream(std::unique_ptr<LineSource> source)
    : source_(std::move(source)),
      finished_(source_ == nullptr) {}

LineStream::~LineStream() {
    Abandon();
}

LineStream::LineStream(LineStream&& other) noexcept
    : source_(std::move(other.source_)),
      finished_(other.finished_) {
    other.finished_ = true;
}

LineStream& LineStream::operator=(LineStream&& other) noexcept {
    if (this != &other) {
        Abandon();
        source_ = std::move(other.source_);
        finished_ = other.finished_;
        other.finished_ = true;
    }
    return *this;
}

LineStream LineStream::FromLines(std::vector<std::string> lines) {
    return LineStream(std::make_unique<VectorLineSource>(std::move(lines)));
}

std::optional<std::string> LineStream::Next() {
    if (finished_) {
        return std::nullopt;
    }
    auto line = source_->Next();
    if (!line) {
        finished_ = true;
        source_.reset();
    }
    return line;
}

std::vector<std::string> LineStream::Collect() {
    std::vector<std::string> lines;
    while (auto line = Next()) {
        lines.push_back(std::move(*line));
    }
    return lines;
}

void LineStream::Abandon() noexcept {
    if (!finished_ && source_) {
        try {
            source_->Cancel();
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "stream", std::string("cancel failed: ") + ex.what());
        }
    }
    source_.reset();
    finished_ = true;
}

std::vector<std::string> LineSplitter::Feed(const std::string& data) {
    std::vector<std::string> lines;
    partial_ += data;
    std::size_t start = 0;
    while (true) {
        const auto end = partial_.find('\n', start);
        if (end == std::string::npos) {
            break;
        }
        lines.push_back(partial_.substr(start, end - start));
        start = end + 1;
    }
    partial_.erase(0, start);
    return lines;
}

std::optional<std::string> LineSplitter::Flush() {
    if (partial_.empty()) {
        return std::nullopt;
    }
    std::string line;
    line.swap(partial_);
    return line;
}

}  // namespace execbox::execution
