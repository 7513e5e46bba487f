#include "archive.hpp"
#include "command_line_parser.hpp"
#include "compression.hpp"
#include "errors.hpp"
#include "integrity.hpp"
#include "loopback_transport.hpp"
#include "progress_meter.hpp"
#include "protocol.hpp"
#include "seed_derivation.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <array>
#include <cstdio>
#include <cstring>
#include <sstream>

using namespace peerdrop::test;
namespace fs = std::filesystem;

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;

bool test_parse_size_literals(TestContext&) {
  bool ok = parse_size("1k") == 1024 &&
            parse_size("1.5m") == 1572864 &&
            parse_size("1.5M") == 1572864 &&
            parse_size("3g") == 3221225472ULL &&
            parse_size("100") == 100 &&
            parse_size(" 2K ") == 2048 &&
            parse_size("0.5k") == 512 &&
            parse_size("12 k") == 12288 &&
            parse_size("1e3") == 1000;
  for(const char* bad : {"abc", "", "k", "1x", "-1k", "1.2.3m", "0x10", "0x1p4k", "1e", "nan", "inf"}) {
    ok = ok && throws<ConfigurationError>([&]{ parse_size(bad); });
  }
  return ok;
}

bool test_sha256_digests(TestContext&) {
  const std::string abc_digest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  Sha256Stream split;
  split.update("a", 1);
  split.update(Bytes{'b', 'c'});
  Sha256Stream empty;
  return sha256_hex(std::string("abc")) == abc_digest &&
         sha256_hex(Bytes{'a', 'b', 'c'}) == abc_digest &&
         split.hex_digest() == abc_digest &&
         split.hex_digest() == abc_digest &&
         empty.hex_digest() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

bool test_chunk_arithmetic(TestContext&) {
  bool ok = chunk_count_for(12 * kMiB, 5 * kMiB) == 3 &&
            chunk_count_for(0, 5 * kMiB) == 1 &&
            chunk_count_for(5 * kMiB, 5 * kMiB) == 1 &&
            chunk_count_for(5 * kMiB + 1, 5 * kMiB) == 2;
  ok = ok && throws<ConfigurationError>([]{ chunk_count_for(10, 0); });
  return ok;
}

// 12 MiB through the stream strategy arrives as 5 + 5 + 2 MiB gzip chunks.
bool test_stream_chunks_on_the_wire(TestContext& ctx) {
  TempWorkspace ws("chunks");
  auto content = random_bytes(static_cast<std::size_t>(12 * kMiB));
  write_file(ws / "big.bin", content);

  auto logger = std::make_shared<Logger>("chunks");
  ctx.logs.attach(logger);
  auto plan = build_send_plan({(ws / "big.bin").string()}, 5 * kMiB, kStreamProfile, *logger);
  if(plan.manifest.items.size() != 1 || plan.manifest.items[0].num_chunks != 3) return false;

  auto hub = std::make_shared<LoopbackHub>();
  LoopbackTransport sender(hub, 1);
  LoopbackTransport receiver(hub, 2);
  sender.connect(receiver.node_id(), 1);
  receiver.connect(sender.node_id(), 1);
  if(!sender.is_ready() || !receiver.is_ready()) return false;

  TransferConfig config;
  config.chunk_size = 5 * kMiB;
  config.timeout = std::chrono::seconds(5);
  std::ostringstream sink;
  ProgressMeter meter("Sending", plan.manifest.total_size(), 20, false, sink);
  send_items(sender, plan, config, meter, *logger);

  std::vector<std::size_t> sizes;
  Bytes joined;
  for(int i = 0; i < 3; ++i) {
    auto chunk = gzip_decompress(await_receive(receiver.irecv(0), std::chrono::seconds(1), "chunk"));
    sizes.push_back(chunk.size());
    joined.insert(joined.end(), chunk.begin(), chunk.end());
  }
  return sizes == std::vector<std::size_t>{5 * kMiB, 5 * kMiB, 2 * kMiB} &&
         joined == content &&
         meter.done() == 12 * kMiB;
}

bool test_seed_derivation(TestContext&) {
  auto a = derive_seeds("abc");
  auto b = derive_seeds("abc");
  auto c = derive_seeds("abd");
  return a.sender_seed == 7890974251846756380ULL &&
         a.receiver_seed == 11726066885491990532ULL &&
         a.sender_seed == b.sender_seed && a.receiver_seed == b.receiver_seed &&
         (a.sender_seed != c.sender_seed || a.receiver_seed != c.receiver_seed) &&
         a.sender_seed != a.receiver_seed;
}

bool test_identity_preview(TestContext&) {
  auto hub = std::make_shared<LoopbackHub>();
  LoopbackTransport transport(hub, 42);
  auto preview = identity_preview(42);
  return preview == transport.node_id() &&
         preview.size() == 64 &&
         looks_like_sha256_hex(preview) &&
         identity_preview(42) == preview &&
         identity_preview(43) != preview;
}

bool test_redact_token(TestContext&) {
  return redact_token("short") == "<5 chars>" &&
         redact_token("0123456789abcdefghijXYZ") == "01234567...fghijXYZ";
}

Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

const std::string kHash(64, 'a');

std::string stream_manifest(const std::string& items) {
  return R"({"version":"2.1.1","items":)" + items + "}";
}

bool test_manifest_encode_decode(TestContext&) {
  TransferManifest manifest;
  manifest.version = kStreamProfile.version;
  manifest.items.push_back({"dir/a.txt", 12, kHash, 1, false});
  manifest.items.push_back({"b.bin", 0, std::string(64, 'b'), 1, false});
  auto decoded = decode_manifest(encode_manifest(manifest, kStreamProfile), kStreamProfile);
  if(decoded.items.size() != 2 || decoded.version != "2.1.1") return false;
  auto j = manifest_to_json(manifest, kWholeProfile);
  return decoded.items[0].path == "dir/a.txt" && decoded.items[0].size == 12 &&
         decoded.items[1].sha256 == std::string(64, 'b') &&
         !j["items"][0].contains("num_chunks") && j["items"][0].contains("sha256") &&
         manifest_to_json(manifest, kArchiveProfile)["items"][0].contains("is_dir");
}

bool test_manifest_rejections(TestContext&) {
  auto item = [](const std::string& path) {
    return R"({"path":")" + path + R"(","size":3,"sha256":")" + kHash + R"(","num_chunks":1})";
  };
  std::vector<std::string> bad = {
    "not json",
    "[1,2]",
    R"({"version":"2.0.0","items":[]})",
    R"({"items":[]})",
    stream_manifest("{}"),
    stream_manifest("[1]"),
    stream_manifest(R"([{"path":"a","size":3,"num_chunks":1}])"),
    stream_manifest(R"([{"path":"a","size":-1,"sha256":")" + kHash + R"(","num_chunks":1}])"),
    stream_manifest(R"([{"path":"a","size":3,"sha256":")" + kHash + R"(","num_chunks":0}])"),
    stream_manifest(R"([{"path":"a","size":3,"sha256":"xyz","num_chunks":1}])"),
    stream_manifest(R"([{"path":7,"size":3,"sha256":")" + kHash + R"(","num_chunks":1}])"),
    stream_manifest("[" + item("../x") + "]"),
    stream_manifest("[" + item("/etc/passwd") + "]"),
    stream_manifest("[" + item("a//b") + "]"),
    stream_manifest("[" + item("a/./b") + "]"),
    stream_manifest("[" + item("a") + "," + item("a") + "]"),
    stream_manifest("[" + item("a") + "," + item("a/b") + "]"),
  };
  for(const auto& text : bad) {
    if(!throws<ProtocolError>([&]{ decode_manifest(to_bytes(text), kStreamProfile); })) {
      std::cerr << "    accepted: " << text << "\n";
      return false;
    }
  }

  bool version_named = false;
  try {
    decode_manifest(to_bytes(R"({"version":"9.9.9","items":[]})"), kStreamProfile);
  } catch(const ProtocolError& e) {
    version_named = std::string(e.what()).find("9.9.9") != std::string::npos;
  }

  auto whole = to_bytes(R"({"version":"2.0.0","items":[{"path":"a","size":3,"sha256":")" + kHash + R"("}]})");
  auto archive_ok = to_bytes(R"({"version":"1.0.0","items":[{"path":"d","size":3,"is_dir":true}]})");
  auto archive_bad = to_bytes(R"({"version":"1.0.0","items":[{"path":"d","size":3,"is_dir":"yes"}]})");
  return version_named &&
         decode_manifest(whole, kWholeProfile).items.size() == 1 &&
         decode_manifest(archive_ok, kArchiveProfile).items[0].is_dir &&
         throws<ProtocolError>([&]{ decode_manifest(archive_bad, kArchiveProfile); }) &&
         throws<ProtocolError>([&]{ decode_manifest(whole, kStreamProfile); });
}

bool test_send_plan_layout(TestContext& ctx) {
  TempWorkspace ws("plan");
  write_file(ws / "dir/b.txt", std::string("bee"));
  write_file(ws / "dir/a/d.txt", std::string("dee"));
  write_file(ws / "dir/a/c.txt", std::string("see"));
  write_file(ws / "top.bin", random_bytes(1000));
  auto logger = std::make_shared<Logger>("plan");
  ctx.logs.attach(logger);

  auto plan = build_send_plan({(ws / "dir").string(), (ws / "top.bin").string()}, 256, kStreamProfile, *logger);
  std::vector<std::string> paths;
  for(const auto& item : plan.manifest.items) paths.push_back(item.path);
  bool ok = paths == std::vector<std::string>{"dir/a/c.txt", "dir/a/d.txt", "dir/b.txt", "top.bin"};
  ok = ok && plan.manifest.items[3].size == 1000 &&
       plan.manifest.items[3].num_chunks == 4 &&
       plan.manifest.items[3].sha256 == *compute_file_hash(ws / "top.bin") &&
       plan.manifest.items[0].sha256 == sha256_hex(std::string("see")) &&
       plan.manifest.version == "2.1.1";

  auto whole = build_send_plan({(ws / "top.bin").string()}, 256, kWholeProfile, *logger);
  ok = ok && whole.entries[0].payload &&
       whole.manifest.items[0].size == whole.entries[0].payload->size() &&
       gzip_decompress(*whole.entries[0].payload) == read_file(ws / "top.bin");

  auto archive = build_send_plan({(ws / "dir").string()}, 256, kArchiveProfile, *logger);
  ok = ok && archive.manifest.items.size() == 1 && archive.manifest.items[0].is_dir &&
       archive.manifest.items[0].path == "dir";

  ok = ok && throws<ConfigurationError>([&]{
    build_send_plan({(ws / "missing").string()}, 256, kStreamProfile, *logger);
  });
  ok = ok && throws<ConfigurationError>([&]{
    build_send_plan({(ws / "top.bin").string(), (ws / "top.bin").string()}, 256, kStreamProfile, *logger);
  });
  return ok;
}

bool test_unreadable_subdirectory(TestContext& ctx) {
  TempWorkspace ws("unreadable");
  write_file(ws / "dir/ok.txt", std::string("fine"));
  write_file(ws / "dir/locked/hidden.txt", std::string("secret"));
  fs::permissions(ws / "dir/locked", fs::perms::none);
  // Privileged users read through mode 000; nothing to check then.
  std::error_code peek_ec;
  fs::directory_iterator peek(ws / "dir/locked", peek_ec);
  if(!peek_ec) {
    fs::permissions(ws / "dir/locked", fs::perms::owner_all);
    return true;
  }
  auto logger = std::make_shared<Logger>("plan");
  ctx.logs.attach(logger);
  bool ok = throws<ConfigurationError>([&]{
    build_send_plan({(ws / "dir").string()}, 256, kStreamProfile, *logger);
  });
  ok = ok && throws<TransferError>([&]{ pack_directory(ws / "dir"); });
  fs::permissions(ws / "dir/locked", fs::perms::owner_all);
  return ok;
}

bool test_resolve_transfer_name(TestContext&) {
  TempWorkspace ws("names");
  fs::create_directories(ws / "photos");
  auto cwd_name = fs::current_path().filename().string();
  return resolve_transfer_name(ws / "photos") == "photos" &&
         resolve_transfer_name((ws / "photos").string() + "/") == "photos" &&
         resolve_transfer_name(ws / "photos" / ".") == "photos" &&
         resolve_transfer_name(ws / "photos" / "..") == ws.root().filename().string() &&
         resolve_transfer_name(".") == (cwd_name.empty() ? "root" : cwd_name) &&
         resolve_transfer_name("/") == "root";
}

bool test_gzip_codec(TestContext&) {
  auto data = random_bytes(300000);
  Bytes text(100000, 'z');
  auto packed_text = gzip_compress(text);
  bool ok = gzip_decompress(gzip_compress(data)) == data &&
            gzip_decompress(gzip_compress(Bytes{})).empty() &&
            packed_text.size() < text.size() / 10 &&
            static_cast<unsigned char>(packed_text[0]) == 0x1f &&
            static_cast<unsigned char>(packed_text[1]) == 0x8b;
  auto truncated = packed_text;
  truncated.resize(truncated.size() / 2);
  ok = ok && throws<TransferError>([&]{ gzip_decompress(truncated); });
  ok = ok && throws<TransferError>([&]{ gzip_decompress(to_bytes("definitely not gzip")); });
  ok = ok && throws<TransferError>([&]{ gzip_decompress(Bytes{}); });
  return ok;
}

std::array<char, 512> raw_tar_header(const std::string& name, char type, uint64_t size) {
  std::array<char, 512> header{};
  std::memcpy(header.data(), name.data(), name.size());
  std::snprintf(header.data() + 100, 8, "%07o", 0644);
  std::snprintf(header.data() + 124, 12, "%011llo", static_cast<unsigned long long>(size));
  header[156] = type;
  std::memcpy(header.data() + 257, "ustar", 6);
  std::memcpy(header.data() + 263, "00", 2);
  unsigned sum = 0;
  for(std::size_t i = 0; i < header.size(); ++i) {
    sum += (i >= 148 && i < 156) ? ' ' : static_cast<unsigned char>(header[i]);
  }
  std::snprintf(header.data() + 148, 8, "%06o", sum);
  header[155] = ' ';
  return header;
}

bool test_archive_codec(TestContext&) {
  TempWorkspace ws("tar");
  std::string long_dir(120, 'x');
  write_file(ws / "src/readme.txt", std::string("hello"));
  write_file(ws / "src/nested/blob.bin", random_bytes(5000));
  write_file(ws / "src" / long_dir / "deep.txt", std::string("long name"));
  write_file(ws / "src/empty.txt", Bytes{});
  fs::create_directories(ws / "src/empty_dir");

  auto archive = pack_directory(ws / "src");
  fs::create_directories(ws / "out");
  unpack_archive(archive, ws / "out");
  bool ok = archive.size() % 512 == 0 &&
            read_file(ws / "out/readme.txt") == read_file(ws / "src/readme.txt") &&
            read_file(ws / "out/nested/blob.bin") == read_file(ws / "src/nested/blob.bin") &&
            read_file(ws / "out" / long_dir / "deep.txt") == to_bytes("long name") &&
            fs::exists(ws / "out/empty.txt") && fs::file_size(ws / "out/empty.txt") == 0 &&
            fs::is_directory(ws / "out/empty_dir");

  auto corrupted = archive;
  corrupted[10] = static_cast<char>(corrupted[10] ^ 0x20);
  fs::create_directories(ws / "out2");
  ok = ok && throws<ProtocolError>([&]{ unpack_archive(corrupted, ws / "out2"); });

  for(const std::string evil : {"../evil.txt", "/abs.txt", "a/../../b"}) {
    auto header = raw_tar_header(evil, '0', 1);
    Bytes crafted(header.begin(), header.end());
    crafted.push_back('x');
    crafted.resize(1024 + 1024, '\0');
    ok = ok && throws<ProtocolError>([&]{ unpack_archive(crafted, ws / "out2"); });
  }
  auto link = raw_tar_header("link", '2', 0);
  Bytes with_link(link.begin(), link.end());
  with_link.resize(512 + 1024, '\0');
  ok = ok && throws<ProtocolError>([&]{ unpack_archive(with_link, ws / "out2"); });
  ok = ok && throws<ProtocolError>([&]{ unpack_archive(Bytes(archive.begin(), archive.begin() + 512), ws / "out3"); });
  return ok && !fs::exists(ws.root().parent_path() / "evil.txt");
}

bool test_staging_commit(TestContext& ctx) {
  TempWorkspace ws("staging");
  auto logger = std::make_shared<Logger>("staging");
  ctx.logs.attach(logger);
  auto content = to_bytes("payload");
  auto hash = sha256_hex(content);

  {
    StagingFile staging(ws / "ok.txt");
    staging.append(content);
    staging.verify(hash, content.size(), *logger);
    staging.commit(*logger);
  }
  bool ok = read_file(ws / "ok.txt") == content && !has_staging_leftovers(ws.root());

  write_file(ws / "taken.txt", std::string("original"));
  ok = ok && throws<PathConflictError>([&]{
    StagingFile staging(ws / "taken.txt");
    staging.append(content);
    staging.commit(*logger);
  });
  ok = ok && read_file(ws / "taken.txt") == to_bytes("original") && !has_staging_leftovers(ws.root());

  ok = ok && throws<IntegrityError>([&]{
    StagingFile staging(ws / "bad.txt");
    staging.append(content);
    staging.verify(std::string(64, '0'), content.size(), *logger);
  });
  ok = ok && throws<IntegrityError>([&]{
    StagingFile staging(ws / "short.txt");
    staging.append(content);
    staging.verify(hash, content.size() + 1, *logger);
  });
  ok = ok && !fs::exists(ws / "bad.txt") && !fs::exists(ws / "short.txt") && !has_staging_leftovers(ws.root());

  {
    StagingFile abandoned(ws / "abandoned.txt");
    abandoned.append(content);
    ok = ok && fs::exists(abandoned.path());
  }
  return ok && !has_staging_leftovers(ws.root()) && !fs::exists(ws / "abandoned.txt");
}

bool test_destination_preflight(TestContext&) {
  TempWorkspace ws("preflight");
  TransferManifest manifest;
  manifest.version = kStreamProfile.version;
  manifest.items.push_back({"fresh.txt", 1, kHash, 1, false});
  manifest.items.push_back({"sub/existing.txt", 1, kHash, 1, false});
  check_destinations_clear(ws.root(), manifest);
  write_file(ws / "sub/existing.txt", std::string("x"));
  bool named = false;
  try {
    check_destinations_clear(ws.root(), manifest);
  } catch(const PathConflictError& e) {
    named = std::string(e.what()).find("sub/existing.txt") != std::string::npos;
  }
  return named;
}

std::vector<char*> make_argv(std::vector<std::string>& args) {
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);
  return argv;
}

bool test_cli_and_settings(TestContext& ctx) {
  TempWorkspace ws("cli");
  CommandLineParser parser("peerdrop");

  SettingsManager settings;
  settings.set_settings_path(ws / ".config/peerdrop.json");
  std::vector<std::string> args = {"peerdrop", "--chunk_size", "1.5m", "-v", "a.txt", "--latency=0", "dir/", "--mode", "whole"};
  auto argv = make_argv(args);
  parser.parse(static_cast<int>(args.size()), argv.data(), settings);

  auto logger = std::make_shared<Logger>("cli");
  ctx.logs.attach(logger);
  auto options = session_options_from_settings(settings, "token", *logger);
  bool ok = settings.get<bool>("verbose") &&
            options.role == Role::Sender &&
            options.paths == std::vector<std::string>{"a.txt", "dir/"} &&
            options.chunk_size == 1572864 &&
            options.latency.count() == 0 &&
            options.profile == &kWholeProfile &&
            options.connect_retries == 30 &&
            options.message_timeout == std::chrono::seconds(300);

  SettingsManager bad;
  std::vector<std::string> unknown = {"peerdrop", "--nope", "1"};
  auto unknown_argv = make_argv(unknown);
  ok = ok && throws<ConfigurationError>([&]{ parser.parse(3, unknown_argv.data(), bad); });
  std::vector<std::string> bad_int = {"peerdrop", "--timeout", "soon"};
  auto bad_int_argv = make_argv(bad_int);
  ok = ok && throws<ConfigurationError>([&]{ parser.parse(3, bad_int_argv.data(), bad); });

  SettingsManager receiver;
  receiver.set("chunk_size", "1m");
  auto receiver_options = session_options_from_settings(receiver, "token", *logger);
  ok = ok && receiver_options.role == Role::Receiver &&
       ctx.logs.contains("ignored in receiver mode") &&
       ctx.logs.count(LogChannel::Warn) == 1;

  SettingsManager zero;
  zero.set("chunk_size", "0");
  ok = ok && throws<ConfigurationError>([&]{ session_options_from_settings(zero, "token", *logger); });
  SettingsManager huge_chunk;
  huge_chunk.set("chunk_size", "3g");
  huge_chunk.set("paths", "a.txt");
  ok = ok && throws<ConfigurationError>([&]{ session_options_from_settings(huge_chunk, "token", *logger); });
  SettingsManager max_chunk;
  max_chunk.set("chunk_size", "1g");
  max_chunk.set("paths", "a.txt");
  ok = ok && session_options_from_settings(max_chunk, "token", *logger).chunk_size == kMaxChunkSize;
  SettingsManager mode;
  mode.set("protocol", "carrier-pigeon");
  ok = ok && throws<ConfigurationError>([&]{ session_options_from_settings(mode, "token", *logger); });

  settings.set("listen_port", "9000");
  ok = ok && settings.save() &&
       settings.source("chunk_size") == SettingSource::CommandLine &&
       !settings.is_overridden("timeout");
  SettingsManager reloaded;
  reloaded.set_settings_path(ws / ".config/peerdrop.json");
  ok = ok && reloaded.load() &&
       reloaded.get<int>("listen_port") == 9000 &&
       reloaded.get<std::string>("chunk_size") == "1.5m" &&
       reloaded.get<std::vector<std::string>>("paths").empty() &&
       reloaded.source("listen_port") == SettingSource::File;

  write_file(ws / ".config/broken.json", std::string("{\"timeout\": \"soon\"}"));
  SettingsManager broken;
  broken.set_settings_path(ws / ".config/broken.json");
  ok = ok && throws<ConfigurationError>([&]{ broken.load(); });
  return ok;
}

bool test_progress_bar(TestContext&) {
  std::ostringstream out;
  {
    ProgressMeter meter("Receiving", 100, 10, true, out);
    meter.advance(50, "file.bin", 1, 2);
    meter.advance(50, "file.bin", 2, 2);
  }
  std::ostringstream silent;
  {
    ProgressMeter meter("Receiving", 100, 10, false, silent);
    meter.advance(100, "file.bin", 1, 1);
  }
  return ProgressMeter::format_bar(0, 100, 10) == std::string(10, ' ') &&
         ProgressMeter::format_bar(100, 100, 10) == std::string(10, '#') &&
         ProgressMeter::format_bar(50, 100, 10) == "#####     " &&
         ProgressMeter::format_bar(0, 0, 4) == "____" &&
         out.str().find("file.bin 2/2") != std::string::npos &&
         out.str().find('\r') != std::string::npos &&
         silent.str().empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"parse_size_literals", test_parse_size_literals},
    {"sha256_digests", test_sha256_digests},
    {"chunk_arithmetic", test_chunk_arithmetic},
    {"stream_chunks_on_the_wire", test_stream_chunks_on_the_wire},
    {"seed_derivation", test_seed_derivation},
    {"identity_preview", test_identity_preview},
    {"redact_token", test_redact_token},
    {"manifest_encode_decode", test_manifest_encode_decode},
    {"manifest_rejections", test_manifest_rejections},
    {"send_plan_layout", test_send_plan_layout},
    {"unreadable_subdirectory", test_unreadable_subdirectory},
    {"resolve_transfer_name", test_resolve_transfer_name},
    {"gzip_codec", test_gzip_codec},
    {"archive_codec", test_archive_codec},
    {"staging_commit", test_staging_commit},
    {"destination_preflight", test_destination_preflight},
    {"cli_and_settings", test_cli_and_settings},
    {"progress_bar", test_progress_bar}
  };
  return run_tests("protocol", argc, argv, tests);
}
