#include <sessionvault/config.hpp>
#include <sessionvault/engine.hpp>
#include <sessionvault/internal.hpp>
#include <sessionvault/logging.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage: " << argv0 << " [options] <command> [args]\n"
      << "  put-blob <file> [mime_type]\n"
      << "  get-blob <hash> <out_file>\n"
      << "  ref <hash> <owner_id> [attachment_id]\n"
      << "  unref <hash> <owner_id> [attachment_id]\n"
      << "  refs <hash>\n"
      << "  verify <hash>\n"
      << "  gc\n"
      << "  stats\n"
      << "  list\n"
      << "  show <record_id>\n"
      << "  delete-record <record_id>\n"
      << "run with --help for options\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

static int Fail(const char* what, const rocksdb::Status& s) {
  std::cerr << what << " failed: " << s.ToString() << "\n";
  return 1;
}

int main(int argc, char** argv) {
  sessionvault::Config config;
  try {
    config = sessionvault::Config::LoadFromArgs(argc, argv);
    config.Validate();
  } catch (const std::runtime_error& e) {
    std::cerr << "error: " << e.what() << "\n";
    usage(argv[0]);
    return 2;
  }

  const std::vector<std::string>& args = config.args;
  if (args.empty()) { usage(argv[0]); return 2; }
  const std::string& cmd = args[0];

  sessionvault::SetLogLevel(config.log_level);

  std::unique_ptr<sessionvault::Engine> engine;
  auto s = sessionvault::Engine::Open(config.db_path, &engine, config.ToEngineOptions());
  if (!s.ok()) return Fail("Open", s);

  auto& content = engine->content();
  auto& records = engine->records();

  if (cmd == "put-blob") {
    if (args.size() < 2 || args.size() > 3) { usage(argv[0]); return 2; }
    std::string data;
    if (!ReadFile(args[1], &data)) {
      std::cerr << "Cannot read " << args[1] << "\n";
      return 1;
    }
    const std::string mime = args.size() == 3 ? args[2] : "application/octet-stream";
    std::string hash;
    s = content.Save(data, mime, &hash);
    if (!s.ok()) return Fail("Save", s);
    std::cout << hash << "\n";
    return 0;
  } else if (cmd == "get-blob") {
    if (args.size() != 3) { usage(argv[0]); return 2; }
    sessionvault::Blob blob;
    s = content.Load(args[1], &blob);
    if (!s.ok()) return Fail("Load", s);
    std::ofstream out(args[2], std::ios::binary);
    out.write(blob.data.data(), static_cast<std::streamsize>(blob.data.size()));
    if (!out) {
      std::cerr << "Cannot write " << args[2] << "\n";
      return 1;
    }
    std::cout << "bytes=" << blob.size() << " mime_type=" << blob.mime_type << "\n";
    return 0;
  } else if (cmd == "ref" || cmd == "unref") {
    if (args.size() < 3 || args.size() > 4) { usage(argv[0]); return 2; }
    const std::string attachment = args.size() == 4 ? args[3] : std::string();
    if (cmd == "ref") {
      s = content.AddReference(args[1], args[2], attachment);
    } else {
      s = content.RemoveReference(args[1], args[2], attachment);
    }
    if (!s.ok()) return Fail(cmd.c_str(), s);
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "refs") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    std::vector<sessionvault::Reference> refs;
    s = content.References(args[1], &refs);
    if (!s.ok()) return Fail("References", s);
    for (const auto& r : refs) {
      std::cout << r.owner_id << "\t" << r.attachment_id << "\t" << r.added_at_ms << "\n";
    }
    std::cout << "ref_count=" << refs.size() << "\n";
    return 0;
  } else if (cmd == "verify") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    bool ok = false;
    s = content.Verify(args[1], &ok);
    if (!s.ok()) return Fail("Verify", s);
    std::cout << (ok ? "OK" : "MISMATCH") << "\n";
    return ok ? 0 : 1;
  } else if (cmd == "gc") {
    if (args.size() != 1) { usage(argv[0]); return 2; }
    sessionvault::GcResult result;
    s = content.CollectGarbage(&result, [](const sessionvault::GcProgress& p) {
      std::cerr << "\r" << p.current << "/" << p.total << " " << p.status << std::flush;
    });
    std::cerr << "\n";
    if (!s.ok()) return Fail("CollectGarbage", s);
    std::cout << "deleted=" << result.deleted << "\n"
              << "freed_bytes=" << result.freed_bytes << "\n"
              << "errors=" << result.errors.size() << "\n"
              << "duration_ms=" << result.duration_ms << "\n";
    for (const auto& e : result.errors) std::cerr << e << "\n";
    return result.errors.empty() ? 0 : 1;
  } else if (cmd == "stats") {
    if (args.size() != 1) { usage(argv[0]); return 2; }
    sessionvault::ContentStats stats;
    s = content.Stats(&stats);
    if (!s.ok()) return Fail("Stats", s);
    std::vector<std::string> ids;
    s = records.ListRecordIds(&ids);
    if (!s.ok()) return Fail("ListRecordIds", s);
    std::cout << "records=" << ids.size() << "\n"
              << "total_blobs=" << stats.total_blobs << "\n"
              << "total_bytes=" << stats.total_bytes << "\n"
              << "total_references=" << stats.total_references << "\n"
              << "dedup_savings_bytes=" << stats.dedup_savings_bytes << "\n"
              << "average_references_per_blob=" << stats.average_references_per_blob << "\n";
    return 0;
  } else if (cmd == "list") {
    if (args.size() != 1) { usage(argv[0]); return 2; }
    std::vector<sessionvault::RecordMetadata> all;
    s = records.ListAllMetadata(&all);
    if (!s.ok()) return Fail("ListAllMetadata", s);
    for (const auto& md : all) {
      std::cout << md.id << "\tupdated_at_ms=" << md.updated_at_ms;
      for (const auto& kv : md.chunks) std::cout << "\t" << kv.first << "=" << kv.second.count;
      std::cout << "\n";
    }
    return 0;
  } else if (cmd == "show") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    sessionvault::RecordMetadata md;
    s = records.LoadMetadata(args[1], &md);
    if (!s.ok()) return Fail("LoadMetadata", s);
    std::cout << md.ToJson().toStyledString();
    return 0;
  } else if (cmd == "delete-record") {
    if (args.size() != 2) { usage(argv[0]); return 2; }
    s = records.DeleteRecord(args[1]);
    if (!s.ok()) return Fail("DeleteRecord", s);
    std::cout << "OK\n";
    return 0;
  } else {
    usage(argv[0]);
    return 2;
  }
}
