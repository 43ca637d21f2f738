/**
 * @file debug.h
 * @brief Debug tracing facility for dsvkit.
 */

#ifndef DSVKIT_DEBUG_H
#define DSVKIT_DEBUG_H

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace dsvkit {

struct DebugConfig {
    bool verbose = false;
    bool dump_buffers = false;
    bool timing = false;
    size_t dump_context_bytes = 64;
    FILE* output = nullptr;

    DebugConfig() = default;

    static DebugConfig all() {
        DebugConfig config;
        config.verbose = true;
        config.dump_buffers = true;
        config.timing = true;
        return config;
    }

    bool enabled() const {
        return verbose || dump_buffers || timing;
    }
};

struct PhaseTime {
    std::string name;
    std::chrono::nanoseconds duration;
    size_t bytes_processed = 0;

    double seconds() const {
        return duration.count() / 1e9;
    }

    double throughput_mbps() const {
        if (bytes_processed == 0 || duration.count() == 0) return 0.0;
        return (bytes_processed / 1e6) / seconds();
    }
};

/**
 * @class DebugTrace
 * @brief Provides debug logging, timing, and buffer dumping facilities.
 *
 * Every tokenizer and sniffer owns its own trace built from the DebugConfig
 * of its options, so traces are never shared between instances.
 */
class DebugTrace {
public:
    explicit DebugTrace(const DebugConfig& config = DebugConfig())
        : config_(config) {}

    bool enabled() const { return config_.enabled(); }
    bool verbose() const { return config_.verbose; }
    bool timing() const { return config_.timing; }

    // The format attribute uses index 2 for fmt because 'this' is implicit parameter 1
    #if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
    #endif
    void log(const char* fmt, ...) const {
        if (!config_.verbose) return;
        FILE* out = config_.output ? config_.output : stdout;
        fprintf(out, "[dsvkit] ");
        va_list args;
        va_start(args, fmt);
        vfprintf(out, fmt, args);
        va_end(args);
        fprintf(out, "\n");
        fflush(out);
    }

    // Logs a string without format interpretation (for user data).
    void log_str(const char* msg) const {
        if (!config_.verbose) return;
        FILE* out = config_.output ? config_.output : stdout;
        fprintf(out, "[dsvkit] %s\n", msg);
        fflush(out);
    }

    void log_decision(const char* decision, const char* reason) const {
        if (!config_.verbose) return;
        FILE* out = config_.output ? config_.output : stdout;
        fprintf(out, "[dsvkit] DECISION: %s | Reason: %s\n", decision, reason);
        fflush(out);
    }

    void log_score(const char* what, char c, int score) const {
        if (!config_.verbose) return;
        FILE* out = config_.output ? config_.output : stdout;
        char c_str[8];
        format_char(c, c_str, sizeof(c_str));
        fprintf(out, "[dsvkit] SCORE %s '%s' = %d\n", what, c_str, score);
        fflush(out);
    }

    void log_candidate(char separator, char quote, int score, bool verified) const {
        if (!config_.verbose) return;
        FILE* out = config_.output ? config_.output : stdout;
        char sep_str[8], quote_str[8];
        format_char(separator, sep_str, sizeof(sep_str));
        format_char(quote, quote_str, sizeof(quote_str));
        fprintf(out, "[dsvkit] CANDIDATE separator='%s', quote='%s', score=%d: %s\n",
                sep_str, quote_str, score, verified ? "verified" : "rejected");
        fflush(out);
    }

    void dump_buffer(const char* name, const uint8_t* buf, size_t len, size_t offset = 0) const {
        if (!config_.dump_buffers) return;
        FILE* out = config_.output ? config_.output : stdout;
        size_t dump_len = (len < config_.dump_context_bytes) ? len : config_.dump_context_bytes;
        fprintf(out, "[dsvkit] BUFFER %s @ offset %zu (showing %zu of %zu bytes):\n",
                name, offset, dump_len, len);
        fprintf(out, "  hex: ");
        for (size_t i = 0; i < dump_len; ++i) {
            fprintf(out, "%02x ", buf[i]);
            if ((i + 1) % 16 == 0 && i + 1 < dump_len) {
                fprintf(out, "\n       ");
            }
        }
        fprintf(out, "\n  txt: ");
        for (size_t i = 0; i < dump_len; ++i) {
            char c = static_cast<char>(buf[i]);
            fprintf(out, "%c", (c >= 32 && c < 127) ? c : '.');
        }
        fprintf(out, "\n");
        fflush(out);
    }

    void start_phase(const char* phase_name) {
        if (!config_.timing) return;
        current_phase_ = phase_name;
        phase_start_ = std::chrono::high_resolution_clock::now();
    }

    void end_phase(size_t bytes_processed = 0) {
        if (!config_.timing) return;
        auto end = std::chrono::high_resolution_clock::now();
        PhaseTime pt;
        pt.name = current_phase_;
        pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - phase_start_);
        pt.bytes_processed = bytes_processed;
        phase_times_.push_back(pt);
    }

    void print_timing_summary() const {
        if (!config_.timing || phase_times_.empty()) return;
        FILE* out = config_.output ? config_.output : stdout;
        fprintf(out, "\n[dsvkit] TIMING SUMMARY:\n");
        fprintf(out, "  %-30s %12s %12s %12s\n",
                "Phase", "Time (ms)", "Bytes", "Throughput");
        fprintf(out, "  %s\n", std::string(70, '-').c_str());

        for (const auto& pt : phase_times_) {
            double ms = pt.duration.count() / 1e6;
            fprintf(out, "  %-30s %12.3f %12zu",
                    pt.name.c_str(), ms, pt.bytes_processed);
            if (pt.bytes_processed > 0) {
                fprintf(out, " %9.2f MB/s", pt.throughput_mbps());
            }
            fprintf(out, "\n");
        }
        fprintf(out, "\n");
        fflush(out);
    }

    const std::vector<PhaseTime>& get_phase_times() const {
        return phase_times_;
    }

private:
    DebugConfig config_;
    std::string current_phase_;
    std::chrono::high_resolution_clock::time_point phase_start_;
    std::vector<PhaseTime> phase_times_;

    static void format_char(char c, char* buf, size_t buf_size) {
        if (c == '\0') snprintf(buf, buf_size, "\\0");
        else if (c == '\t') snprintf(buf, buf_size, "\\t");
        else if (c == '\n') snprintf(buf, buf_size, "\\n");
        else if (c == '\r') snprintf(buf, buf_size, "\\r");
        else if (c >= 32 && c < 127) snprintf(buf, buf_size, "%c", c);
        else snprintf(buf, buf_size, "\\x%02x", (unsigned char)c);
    }
};

class ScopedPhaseTimer {
public:
    ScopedPhaseTimer(DebugTrace& trace, const char* phase_name, size_t bytes = 0)
        : trace_(trace), bytes_(bytes) {
        trace_.start_phase(phase_name);
    }

    ~ScopedPhaseTimer() {
        trace_.end_phase(bytes_);
    }

    void set_bytes(size_t bytes) { bytes_ = bytes; }

private:
    DebugTrace& trace_;
    size_t bytes_;
};

} // namespace dsvkit

#endif // DSVKIT_DEBUG_H
