#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <memory>
#include <vector>

namespace fpack {

// Reads each source to its end, in order, as one stream.
class ChainReader final : public IReader {
  public:
    void Append(std::unique_ptr<IReader> source) { sources_.push_back(std::move(source)); }

    ssize_t Read(std::span<std::uint8_t> out) override {
        while (index_ < sources_.size()) {
            const ssize_t n = sources_[index_]->Read(out);
            if (n != 0) return n;
            ++index_;
        }
        return 0;
    }

    std::optional<std::uint64_t> TotalSize() const override {
        std::uint64_t total = 0;
        for (const auto& s : sources_) {
            auto size = s->TotalSize();
            if (!size) return std::nullopt;
            total += *size;
        }
        return total;
    }

  private:
    std::vector<std::unique_ptr<IReader>> sources_;
    size_t index_ = 0;
};

// Serves a fixed in-memory buffer, e.g. a payload header.
class BufferReader final : public IReader {
  public:
    explicit BufferReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override { return data_.size(); }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace fpack
