#include <gtest/gtest.h>
#include "rtl433/supervisor/line_reader.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace rtl433::supervisor;
using namespace std::chrono_literals;

namespace {

struct Pipe {
  int fds[2] = {-1, -1};
  Pipe() { EXPECT_EQ(::pipe(fds), 0); }
  ~Pipe() {
    close_write();
    if (fds[0] >= 0) ::close(fds[0]);
  }
  void write(const std::string& s) { ASSERT_EQ(::write(fds[1], s.data(), s.size()), static_cast<ssize_t>(s.size())); }
  void close_write() {
    if (fds[1] >= 0) ::close(fds[1]);
    fds[1] = -1;
  }
};

std::vector<std::string> read_all(Pipe& pipe, std::size_t max_line) {
  std::vector<std::string> lines;
  std::atomic<bool> cancel{false};
  LineReader reader(pipe.fds[0], max_line);
  auto end = reader.run([&](std::string_view l) { lines.emplace_back(l); }, cancel, 20ms);
  EXPECT_EQ(end, LineReader::EndReason::Eof);
  return lines;
}

} // namespace

TEST(LineReader, SplitsLines) {
  Pipe pipe;
  pipe.write("one\ntwo\r\n\nthree");
  pipe.close_write();
  auto lines = read_all(pipe, 1024);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "one");
  EXPECT_EQ(lines[1], "two");
  EXPECT_EQ(lines[2], "");
  // Final unterminated line is flushed at EOF.
  EXPECT_EQ(lines[3], "three");
}

TEST(LineReader, LinesSpanningReads) {
  Pipe pipe;
  std::thread writer([&] {
    pipe.write("{\"model\":");
    std::this_thread::sleep_for(20ms);
    pipe.write("\"X\"}\n{\"id\"");
    std::this_thread::sleep_for(20ms);
    pipe.write(":1}\n");
    pipe.close_write();
  });
  auto lines = read_all(pipe, 1024);
  writer.join();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "{\"model\":\"X\"}");
  EXPECT_EQ(lines[1], "{\"id\":1}");
}

TEST(LineReader, TruncatesOverlongLines) {
  Pipe pipe;
  std::thread writer([&] {
    pipe.write(std::string(10000, 'a') + "\nshort\n");
    pipe.close_write();
  });
  std::vector<std::string> lines;
  std::atomic<bool> cancel{false};
  LineReader reader(pipe.fds[0], 16);
  reader.run([&](std::string_view l) { lines.emplace_back(l); }, cancel, 20ms);
  writer.join();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], std::string(16, 'a'));
  EXPECT_EQ(lines[1], "short");
  EXPECT_EQ(reader.truncated(), 1u);
  EXPECT_EQ(reader.lines(), 2u);
}

TEST(LineReader, CancelUnblocks) {
  Pipe pipe;
  std::atomic<bool> cancel{false};
  LineReader reader(pipe.fds[0]);
  LineReader::EndReason end = LineReader::EndReason::Eof;
  std::thread t([&] { end = reader.run([](std::string_view) {}, cancel, 10ms); });
  std::this_thread::sleep_for(50ms);
  cancel.store(true);
  t.join();
  EXPECT_EQ(end, LineReader::EndReason::Cancelled);
}
