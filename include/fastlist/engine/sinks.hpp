#pragma once

#include "fastlist/engine/record.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace fastlist::engine {

// Destination for aggregated results. Write failures throw std::runtime_error.
class RecordSink {
public:
    virtual ~RecordSink() = default;

    virtual void write(const ObjectRecord &record) = 0;
    virtual void write(const DiffResult &result) = 0;
    virtual void flush() = 0;
};

// Truncates or creates path. Throws std::runtime_error if it cannot be opened.
[[nodiscard]] std::unique_ptr<std::ostream> open_output(const std::filesystem::path &path);

// Keys only: "<key>" for records, "<diff>\t<key>" for diff results.
class PlainSink : public RecordSink {
private:
    std::unique_ptr<std::ostream> out_;

public:
    [[nodiscard]] explicit PlainSink(std::unique_ptr<std::ostream> out) : out_{std::move(out)} {}

    void write(const ObjectRecord &record) override;
    void write(const DiffResult &result) override;
    void flush() override;
};

// One JSON object per line.
class JsonSink : public RecordSink {
private:
    std::unique_ptr<std::ostream> out_;

public:
    [[nodiscard]] explicit JsonSink(std::unique_ptr<std::ostream> out) : out_{std::move(out)} {}

    void write(const ObjectRecord &record) override;
    void write(const DiffResult &result) override;
    void flush() override;
};

// Keeps about one in n listed keys, chosen by key hash, and writes them sorted on flush.
// Memory grows with the sample, not the bucket. The output is a hints file for later runs.
class KeySpaceSampler : public RecordSink {
private:
    std::unique_ptr<std::ostream> out_;
    std::size_t every_;
    std::vector<std::string> keys_;

public:
    constexpr static std::size_t default_every = 1000;

    [[nodiscard]] explicit KeySpaceSampler(std::unique_ptr<std::ostream> out, std::size_t every = default_every);

    void write(const ObjectRecord &record) override;
    // diff results are not sampled
    void write(const DiffResult &result) override;
    void flush() override;
};

} // namespace fastlist::engine
