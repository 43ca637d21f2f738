/**
 * Test helpers for dsvkit unit tests.
 *
 * Provides stream buffers that fail on demand, to exercise the error paths
 * of the tokenizer and the writer.
 */

#ifndef DSVKIT_TEST_HELPERS_H
#define DSVKIT_TEST_HELPERS_H

#include <cstddef>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>

/**
 * Input buffer that serves `data` and then throws instead of reporting EOF.
 *
 * Usage:
 *   FailingInputBuf buf("a,b\n");
 *   std::istream in(&buf);
 */
class FailingInputBuf : public std::streambuf {
public:
  explicit FailingInputBuf(std::string data) : data_(std::move(data)) {
    char* p = &data_[0];
    setg(p, p, p + data_.size());
  }

protected:
  int_type underflow() override { throw std::runtime_error("simulated read failure"); }

private:
  std::string data_;
};

/**
 * Output buffer that accepts `limit` bytes and then fails every write.
 */
class FailingOutputBuf : public std::streambuf {
public:
  explicit FailingOutputBuf(size_t limit) : limit_(limit) {}

  const std::string& written() const { return written_; }

protected:
  int_type overflow(int_type ch) override {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
      return traits_type::not_eof(ch);
    }
    if (written_.size() >= limit_) {
      return traits_type::eof();
    }
    written_ += traits_type::to_char_type(ch);
    return ch;
  }

private:
  size_t limit_;
  std::string written_;
};

#endif // DSVKIT_TEST_HELPERS_H
