#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>
#include <string>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace semcloud {
namespace utils {

/**
 * @brief Metadata shared by the products passed between pipeline stages
 */
struct BaseResult {
    using Duration = std::chrono::microseconds;

    double stamp{0.0};              // Capture time of the source frame [s]
    Duration processing_time{0};
    size_t input_count{0};          // Pixels consumed
    size_t output_count{0};         // Pixels produced

    virtual ~BaseResult() = default;

    virtual void clear() {
        stamp = 0.0;
        processing_time = Duration{0};
        input_count = 0;
        output_count = 0;
    }
};

/**
 * @brief Lock-free statistics counter
 *
 * Relaxed ordering only; values are read for reporting, never to synchronize.
 */
class AtomicCounter {
public:
    AtomicCounter(int64_t initial = 0) : value_(initial) {}

    AtomicCounter(const AtomicCounter&) = delete;
    AtomicCounter& operator=(const AtomicCounter&) = delete;

    void increment(int64_t delta = 1) { value_.fetch_add(delta, std::memory_order_relaxed); }
    int64_t get() const { return value_.load(std::memory_order_relaxed); }

    int64_t operator++(int) { return value_.fetch_add(1, std::memory_order_relaxed); }

private:
    std::atomic<int64_t> value_;
};

/**
 * @brief Typed lookups with defaults over a YAML tree
 */
class ConfigLoader {
public:
    template<typename T>
    static T readParam(const YAML::Node& node, const std::string& key,
                      const T& default_value) {
        if (node[key]) {
            return node[key].as<T>();
        }
        return default_value;
    }

    /**
     * @brief Read nested parameter with path like "a.b.c"
     */
    template<typename T>
    static T readNestedParam(const YAML::Node& node, const std::string& path,
                            const T& default_value) {
        YAML::Node current = findNested(node, path);
        if (!current) {
            return default_value;
        }
        return current.as<T>();
    }

    /**
     * @brief Check whether a nested key is present
     */
    static bool hasNestedParam(const YAML::Node& node, const std::string& path) {
        return static_cast<bool>(findNested(node, path));
    }

    /**
     * @brief Resolve a dotted path, returning an invalid node if any key is missing
     */
    static YAML::Node findNested(const YAML::Node& node, const std::string& path) {
        std::vector<std::string> keys;
        std::stringstream ss(path);
        std::string key;

        while (std::getline(ss, key, '.')) {
            keys.push_back(key);
        }

        // YAML::Node assignment rebinds references, so walk with clones
        YAML::Node current = YAML::Clone(node);
        for (const auto& k : keys) {
            if (!current.IsMap() || !current[k]) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            current = YAML::Clone(current[k]);
        }
        return current;
    }
};

/**
 * @brief Writes the lifetime of the scope into a duration on destruction
 */
class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::microseconds;

    explicit ScopedTimer(Duration& output)
        : output_(output), start_(Clock::now()) {}

    ~ScopedTimer() {
        output_ = std::chrono::duration_cast<Duration>(Clock::now() - start_);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Duration& output_;
    Clock::time_point start_;
};

} // namespace utils
} // namespace semcloud
