/**
 * @file test_receiver.cpp
 * @brief Tests for receiver.hpp: path containment, ReceiverSession, Receiver.
 */

#include <catch2/catch_test_macros.hpp>
#include "ferry/receiver.hpp"

#include "test_helpers.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

namespace fs = std::filesystem;

/// Header + payload for @p content, optionally with a damaged checksum.
std::vector<uint8_t> MakeFrame(const std::string& name,
                               const std::string& content,
                               bool corrupt = false) {
  auto d = ferry::HashBytes(content.data(), content.size());
  ferry::Digest sum = d.value();
  if (corrupt) sum[0] = static_cast<uint8_t>(sum[0] ^ 0xFFU);
  auto h = ferry::EncodeFrameHeader(name, content.size(), sum);
  std::vector<uint8_t> out = h.value();
  out.insert(out.end(), content.begin(), content.end());
  return out;
}

/// Runs a session on the server end of a loopback pair.
struct SessionRig {
  explicit SessionRig(const std::string& root, size_t chunk = 1U << 20) {
    auto pair = ferry_test::ConnectedPair();
    client = std::move(pair.first);
    ferry::ReceiverOptions opts;
    opts.dest_dir = root;
    opts.chunk_size = chunk;
    opts.on_transition = &SessionRig::Record;
    opts.hook_ctx = this;
    session.reset(new ferry::ReceiverSession(std::move(pair.second), opts));
  }

  static void Record(ferry::SessionState, ferry::SessionState to, void* ctx) {
    static_cast<SessionRig*>(ctx)->states.push_back(to);
  }

  /// Send @p frame and process it on a helper thread; returns the verdict.
  int Exchange(const std::vector<uint8_t>& frame) {
    std::thread t([this]() { last = session->ProcessFrame(); });
    bool sent = client.SendAll(frame.data(), frame.size()).has_value();
    uint8_t verdict = 0xAA;
    auto r = client.RecvAll(&verdict, 1);
    t.join();
    if (!sent || !r.has_value() || r.value() != 1U) return -1;
    return verdict;
  }

  ferry::TcpSocket client;
  std::unique_ptr<ferry::ReceiverSession> session;
  std::vector<ferry::SessionState> states;
  ferry::expected<bool, ferry::ReceiveError> last =
      ferry::expected<bool, ferry::ReceiveError>::success(false);
};

/// Temp files "<name>.part*" left beside @p name in @p dir.
size_t PartFilesFor(const fs::path& dir, const std::string& name) {
  size_t n = 0;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().filename().string().rfind(name + ".part", 0) == 0) ++n;
  }
  return n;
}

}  // namespace

// ============================================================================
// ResolveDestination
// ============================================================================

TEST_CASE("receiver - ResolveDestination joins relative names",
          "[receiver][path]") {
  auto r = ferry::ResolveDestination("/dst", "a/b/c.txt");
  REQUIRE(r.has_value());
  REQUIRE(r.value() == fs::path("/dst/a/b/c.txt"));

  auto dot = ferry::ResolveDestination("/dst", "./x/./y");
  REQUIRE(dot.has_value());
  REQUIRE(dot.value() == fs::path("/dst/x/y"));
}

TEST_CASE("receiver - ResolveDestination rejects escaping names",
          "[receiver][path]") {
  const char* bad[] = {"../etc/passwd", "a/../../b", "/etc/passwd", "..",
                       ".", "a/..", "dir/"};
  for (const char* n : bad) {
    auto r = ferry::ResolveDestination("/dst", n);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == ferry::ReceiveError::kUnsafePath);
  }
  std::string nul("a\0b", 3);
  REQUIRE(!ferry::ResolveDestination("/dst", nul).has_value());
}

TEST_CASE("receiver - PartPath appends .part", "[receiver][path]") {
  REQUIRE(ferry::PartPath("/dst/a.txt") == fs::path("/dst/a.txt.part"));
}

// ============================================================================
// ReceiverSession
// ============================================================================

TEST_CASE("receiver - valid frame is published and acknowledged",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  REQUIRE(rig.Exchange(MakeFrame("sub/dir/f.txt", "content")) ==
          ferry::kAckByte);
  REQUIRE(rig.last.has_value());
  REQUIRE(rig.last.value());
  REQUIRE(ferry_test::ReadFile(dir.Path() / "sub/dir/f.txt") == "content");
  REQUIRE(PartFilesFor(dir.Path() / "sub/dir", "f.txt") == 0U);
  REQUIRE(rig.session->Stats().published == 1U);
  REQUIRE(rig.session->Stats().bytes == 7U);

  const std::vector<ferry::SessionState> expect = {
      ferry::SessionState::kReceivePayload, ferry::SessionState::kVerify,
      ferry::SessionState::kPublish};
  REQUIRE(rig.states == expect);
}

TEST_CASE("receiver - checksum mismatch is NACKed and the session continues",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  REQUIRE(rig.Exchange(MakeFrame("bad.bin", "payload", true)) ==
          ferry::kNackByte);
  REQUIRE(!fs::exists(dir.Path() / "bad.bin"));
  REQUIRE(PartFilesFor(dir.Path(), "bad.bin") == 0U);
  REQUIRE(rig.session->Stats().rejected == 1U);

  REQUIRE(rig.Exchange(MakeFrame("good.bin", "payload")) == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(dir.Path() / "good.bin") == "payload");
}

TEST_CASE("receiver - unsafe name is drained and NACKed without file I/O",
          "[receiver][session]") {
  ferry_test::TempDir outer("rx_outer");
  const fs::path root = outer.Path() / "root";
  SessionRig rig(root.string());
  REQUIRE(rig.Exchange(MakeFrame("../escape.txt", "evil")) == ferry::kNackByte);
  REQUIRE(!fs::exists(outer.Path() / "escape.txt"));
  REQUIRE(PartFilesFor(outer.Path(), "escape.txt") == 0U);

  // The stream is still in sync.
  REQUIRE(rig.Exchange(MakeFrame("ok.txt", "fine")) == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(root / "ok.txt") == "fine");
}

TEST_CASE("receiver - payload spanning many chunks is stored intact",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str(), 4096U);
  const std::string big = ferry_test::PatternBytes((1U << 20) + 4097U);
  REQUIRE(rig.Exchange(MakeFrame("big.bin", big)) == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(dir.Path() / "big.bin") == big);
}

TEST_CASE("receiver - empty payload publishes an empty file",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  REQUIRE(rig.Exchange(MakeFrame("empty", "")) == ferry::kAckByte);
  REQUIRE(fs::exists(dir.Path() / "empty"));
  REQUIRE(fs::file_size(dir.Path() / "empty") == 0U);
}

TEST_CASE("receiver - republishing a name replaces the file",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  REQUIRE(rig.Exchange(MakeFrame("same.txt", "first version")) ==
          ferry::kAckByte);
  REQUIRE(rig.Exchange(MakeFrame("same.txt", "second")) == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(dir.Path() / "same.txt") == "second");
  REQUIRE(PartFilesFor(dir.Path(), "same.txt") == 0U);
}

TEST_CASE("receiver - leftover .part from an earlier attempt is left alone",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  ferry_test::WriteFile(dir.Path() / "f.txt.part", std::string(1000, 'z'));
  SessionRig rig(dir.Str());
  REQUIRE(rig.Exchange(MakeFrame("f.txt", "new")) == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(dir.Path() / "f.txt") == "new");
  REQUIRE(ferry_test::ReadFile(dir.Path() / "f.txt.part") ==
          std::string(1000, 'z'));
  REQUIRE(PartFilesFor(dir.Path(), "f.txt") == 1U);
}

TEST_CASE("receiver - each frame gets its own temp file",
          "[receiver][path]") {
  ferry_test::TempDir dir("rx");
  const fs::path final_path = dir.Path() / "x.bin";
  fs::path a;
  fs::path b;
  const int32_t fa = ferry::detail::CreatePartFile(final_path, a);
  const int32_t fb = ferry::detail::CreatePartFile(final_path, b);
  REQUIRE(fa >= 0);
  REQUIRE(fb >= 0);
  ::close(fa);
  ::close(fb);
  REQUIRE(a != b);
  REQUIRE(a.parent_path() == dir.Path());
  REQUIRE(a.filename().string().rfind("x.bin.part.", 0) == 0U);
  REQUIRE(PartFilesFor(dir.Path(), "x.bin") == 2U);
}

TEST_CASE("receiver - close mid-payload is a protocol error and leaves no file",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  std::vector<uint8_t> frame = MakeFrame("cut.bin", std::string(100, 'c'));
  frame.resize(frame.size() - 40U);
  REQUIRE(rig.client.SendAll(frame.data(), frame.size()).has_value());
  rig.client.Close();

  auto r = rig.session->ProcessFrame();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ferry::ReceiveError::kProtocol);
  REQUIRE(rig.session->State() == ferry::SessionState::kClosed);
  REQUIRE(!fs::exists(dir.Path() / "cut.bin"));
  REQUIRE(PartFilesFor(dir.Path(), "cut.bin") == 0U);
}

TEST_CASE("receiver - clean close ends Run successfully",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  rig.client.Close();
  auto r = rig.session->Run();
  REQUIRE(r.has_value());
  REQUIRE(rig.session->State() == ferry::SessionState::kClosed);
}

TEST_CASE("receiver - non UTF-8 name closes the session",
          "[receiver][session]") {
  ferry_test::TempDir dir("rx");
  SessionRig rig(dir.Str());
  std::vector<uint8_t> raw = {0x00, 0x02, 0xC3, 0x28};
  raw.resize(raw.size() + ferry::kSizeFieldSize + ferry::kDigestSize, 0);
  REQUIRE(rig.client.SendAll(raw.data(), raw.size()).has_value());
  auto r = rig.session->ProcessFrame();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ferry::ReceiveError::kProtocol);
}

// ============================================================================
// Receiver server
// ============================================================================

TEST_CASE("receiver - server serves concurrent connections",
          "[receiver][server]") {
  ferry_test::TempDir dir("rx_srv");
  ferry::ReceiverOptions opts;
  opts.dest_dir = (dir.Path() / "out").string();
  ferry::Receiver rx(opts);
  REQUIRE(rx.Start("127.0.0.1", 0).has_value());
  REQUIRE(rx.IsRunning());
  REQUIRE(rx.Port() != 0);
  REQUIRE(fs::is_directory(dir.Path() / "out"));

  auto addr = ferry::SocketAddress::FromIpv4("127.0.0.1", rx.Port());
  std::vector<ferry::TcpSocket> clients;
  for (int i = 0; i < 3; ++i) {
    auto s = ferry::TcpSocket::Create();
    REQUIRE(s.value().Connect(addr.value()).has_value());
    clients.push_back(std::move(s.value()));
  }
  for (size_t i = 0; i < clients.size(); ++i) {
    const auto frame = MakeFrame("c" + std::to_string(i), "data");
    REQUIRE(clients[i].SendAll(frame.data(), frame.size()).has_value());
  }
  for (auto& c : clients) {
    uint8_t v = 0;
    REQUIRE(c.RecvAll(&v, 1).value() == 1U);
    REQUIRE(v == ferry::kAckByte);
  }
  rx.Stop();
  REQUIRE(!rx.IsRunning());
  REQUIRE(rx.TotalPublished() == 3U);
  REQUIRE(rx.SessionsServed() == 3U);
}

TEST_CASE("receiver - Start twice fails, bind conflict fails",
          "[receiver][server]") {
  ferry_test::TempDir dir("rx_srv");
  ferry::ReceiverOptions opts;
  opts.dest_dir = dir.Str();
  ferry::Receiver a(opts);
  REQUIRE(a.Start("127.0.0.1", 0).has_value());
  auto again = a.Start("127.0.0.1", 0);
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == ferry::ReceiveError::kAlreadyRunning);

  ferry::Receiver b(opts);
  auto clash = b.Start("127.0.0.1", a.Port());
  REQUIRE(!clash.has_value());
  REQUIRE(clash.get_error() == ferry::ReceiveError::kBindFailed);

  auto bad_ip = b.Start("999.1.1.1", 0);
  REQUIRE(!bad_ip.has_value());
}

TEST_CASE("receiver - interleaved sessions writing one name stay separate",
          "[receiver][server]") {
  ferry_test::TempDir dir("rx_srv");
  ferry::ReceiverOptions opts;
  opts.dest_dir = dir.Str();
  opts.chunk_size = 4096U;
  ferry::Receiver rx(opts);
  REQUIRE(rx.Start("127.0.0.1", 0).has_value());
  auto addr = ferry::SocketAddress::FromIpv4("127.0.0.1", rx.Port());

  const std::string content_a = ferry_test::PatternBytes(4U << 20, 7U);
  const std::string content_b = ferry_test::PatternBytes(4U << 20, 9U);
  const auto frame_a = MakeFrame("same.bin", content_a);
  const auto frame_b = MakeFrame("same.bin", content_b);

  auto a = ferry::TcpSocket::Create();
  auto b = ferry::TcpSocket::Create();
  REQUIRE(a.value().Connect(addr.value()).has_value());
  REQUIRE(b.value().Connect(addr.value()).has_value());

  // A stops halfway through its payload with its temp file open.
  const size_t half = frame_a.size() / 2U;
  REQUIRE(a.value().SendAll(frame_a.data(), half).has_value());
  REQUIRE(ferry_test::WaitFor(
      [&]() { return PartFilesFor(dir.Path(), "same.bin") == 1U; }));

  // B delivers the same name in full meanwhile.
  REQUIRE(b.value().SendAll(frame_b.data(), frame_b.size()).has_value());
  uint8_t vb = 0;
  REQUIRE(b.value().RecvAll(&vb, 1).value() == 1U);
  REQUIRE(vb == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(dir.Path() / "same.bin") == content_b);

  REQUIRE(a.value()
              .SendAll(frame_a.data() + half, frame_a.size() - half)
              .has_value());
  uint8_t va = 0;
  REQUIRE(a.value().RecvAll(&va, 1).value() == 1U);
  REQUIRE(va == ferry::kAckByte);
  REQUIRE(ferry_test::ReadFile(dir.Path() / "same.bin") == content_a);
  REQUIRE(PartFilesFor(dir.Path(), "same.bin") == 0U);

  rx.Stop();
  REQUIRE(rx.TotalPublished() == 2U);
  REQUIRE(rx.TotalRejected() == 0U);
}
