/**
 * @file verify_library.cpp
 * @brief Verify a download root and print its statistics
 *
 * Usage: verify_library <download_root> [snapshot.json]
 *
 * Every completed file is re-hashed against its checkpoint record. Files
 * migrated from the legacy index get their baseline hash recorded. When a
 * snapshot path is given the index is exported there afterwards.
 */

#include <kcenon/bulk_download/bulk_download.h>

#include <iostream>

using namespace kcenon::bulk_download;

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <download_root> [snapshot.json]" << std::endl;
        return 1;
    }

    auto store = checkpoint_store::open(std::filesystem::path(argv[1]));
    if (!store) {
        std::cerr << "Error: " << store.error().message << std::endl;
        return 1;
    }

    integrity_verifier verifier(store.value());
    auto summary = verifier.verify_all();
    if (!summary) {
        std::cerr << "Error: " << summary.error().message << std::endl;
        return 2;
    }

    for (const auto& report : summary.value().reports) {
        if (report.status != verify_status::ok) {
            std::cout << to_string(report.status) << ": " << report.path.string() << " ("
                      << report.message << ")" << std::endl;
        }
    }
    std::cout << "Verified " << summary.value().total() << " files: " << summary.value().ok
              << " ok, " << summary.value().corrupted << " corrupted, "
              << summary.value().missing << " missing" << std::endl;

    auto stats = store.value().statistics();
    if (!stats) {
        std::cerr << "Error: " << stats.error().message << std::endl;
        return 2;
    }
    const auto& s = stats.value();
    std::cout << std::endl;
    std::cout << "Records:   " << s.total_records << " (" << s.completed << " completed, "
              << s.partial << " partial, " << s.errored << " error)" << std::endl;
    std::cout << "Videos:    " << s.total_videos << std::endl;
    std::cout << "PDFs:      " << s.total_pdfs << std::endl;
    std::cout << "Materials: " << s.total_materials << std::endl;
    for (const auto& [course, totals] : s.by_course) {
        std::cout << "  " << course << ": " << totals.files << " files, " << totals.bytes
                  << " bytes" << std::endl;
    }

    if (argc == 3) {
        auto exported = store.value().export_snapshot(std::filesystem::path(argv[2]));
        if (!exported) {
            std::cerr << "Error: " << exported.error().message << std::endl;
            return 2;
        }
        std::cout << "Snapshot written to " << argv[2] << std::endl;
    }

    return summary.value().corrupted + summary.value().missing == 0 ? 0 : 3;
}
