#include <sessionvault/engine.hpp>
#include <sessionvault/shutdown.hpp>

#include <iostream>

int main() {
  sessionvault::EngineOptions opt;
  std::unique_ptr<sessionvault::Engine> engine;

  auto s = sessionvault::Engine::Open("./sessionvault_db", &engine, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  sessionvault::ShutdownHandler shutdown;
  shutdown.RegisterEngine(engine.get());

  auto& records = engine->records();

  // Two sessions that captured the same frame.
  for (const char* id : {"session-a", "session-b"}) {
    sessionvault::RecordMetadata md;
    md.id = id;
    md.fields["title"] = std::string("Recording ") + id;
    s = records.SaveMetadata(md, sessionvault::Priority::kCritical);
    if (!s.ok()) std::cerr << "SaveMetadata failed: " << s.ToString() << "\n";

    std::string hash;
    s = records.SaveAttachment(id, sessionvault::kScreenshots, 0, "frame-0",
                               sessionvault::Blob{"...png bytes...", "image/png"}, &hash);
    if (!s.ok()) {
      std::cerr << "SaveAttachment failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << id << " frame-0 -> " << hash.substr(0, 12) << "\n";
  }

  sessionvault::ContentStats stats;
  s = engine->content().Stats(&stats);
  if (s.ok()) {
    std::cout << "blobs=" << stats.total_blobs << " references=" << stats.total_references
              << " saved=" << stats.dedup_savings_bytes << " bytes\n";
  }

  // Deleting a session releases its references; GC reclaims what nobody holds.
  s = records.DeleteRecord("session-a");
  if (!s.ok()) std::cerr << "DeleteRecord failed: " << s.ToString() << "\n";
  s = records.DeleteRecord("session-b");
  if (!s.ok()) std::cerr << "DeleteRecord failed: " << s.ToString() << "\n";

  sessionvault::GcResult gc;
  s = engine->content().CollectGarbage(&gc);
  if (s.ok()) std::cout << "gc deleted=" << gc.deleted << " freed=" << gc.freed_bytes << "\n";

  shutdown.Shutdown();
  std::cout << "done\n";
  return 0;
}
