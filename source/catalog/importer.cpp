#include "catalog/importer.hpp"

#include <map>
#include <memory>
#include <unordered_set>
#include <utility>
#include "archive/archive_resolver.hpp"
#include "util/config.hpp"
#include "util/error.hpp"

namespace flib::catalog
{
    namespace {
        constexpr double kProgressLogStep = 5.0;

        // Logs every 5% of a member and forwards to the caller's callback.
        class ProgressLogger
        {
            public:
                explicit ProgressLogger(inpx::ProgressCallback forward) : m_forward(std::move(forward)) {}

                void operator()(const std::string& member, std::uint64_t processed, std::uint64_t total)
                {
                    const double percent = total ? (static_cast<double>(processed) * 100.0) / static_cast<double>(total) : 100.0;
                    auto it = m_lastPercent.find(member);
                    const bool first = it == m_lastPercent.end();
                    if (first || percent - it->second >= kProgressLogStep || processed == total) {
                        LOG_DEBUG("Import: [%s] %5.1f%% | %lluMB/%lluMB\n", member.c_str(), percent,
                            static_cast<unsigned long long>(processed >> 20), static_cast<unsigned long long>(total >> 20));
                        m_lastPercent[member] = percent;
                    }
                    if (m_forward)
                        m_forward(member, processed, total);
                }

            private:
                inpx::ProgressCallback m_forward;
                std::map<std::string, double> m_lastPercent;
        };
    }

    ImportOptions ImportOptions::FromConfig()
    {
        ImportOptions options;
        options.libraryRoot = config::libraryRoot;
        options.chunkSize = config::importChunkSize;
        options.fallbackEncoding = config::fallbackEncoding;
        options.progressIntervalBytes = config::progressIntervalBytes;
        return options;
    }

    ImportResult ImportInpx(const std::filesystem::path& dump, CatalogSink& sink, const ImportOptions& options)
    {
        ImportResult result;
        const std::size_t chunkSize = options.chunkSize > 0 ? options.chunkSize : 1;

        try {
            std::unique_ptr<archive::ArchiveResolver> resolver;
            if (!options.libraryRoot.empty())
                resolver = std::make_unique<archive::ArchiveResolver>(options.libraryRoot, archive::ArchiveLayout::FromConfig());

            inpx::InpxParser parser(options.fallbackEncoding, options.progressIntervalBytes);
            inpx::RecordStream stream = parser.Parse(dump, ProgressLogger(options.progress));

            std::unordered_set<std::uint64_t> seen;
            std::vector<CatalogEntry> batch;
            batch.reserve(chunkSize);

            inpx::CatalogRecord record;
            while (stream.Next(record)) {
                if (!record.hasLibId) {
                    result.skipped++;
                    continue;
                }
                if (!seen.insert(record.libId).second || sink.Contains(record.libId)) {
                    result.duplicates++;
                    continue;
                }

                if (resolver) {
                    archive::ResolvedArchives resolved = resolver->Resolve(record.libId);
                    record.payloadArchive = std::move(resolved.payload);
                    record.coverArchive = std::move(resolved.cover);
                    record.illustrationArchive = std::move(resolved.illustration);
                }

                CatalogEntry entry;
                for (const auto& author : record.authors)
                    entry.authorNames.push_back(inpx::SplitAuthorName(author));
                entry.record = std::move(record);
                batch.push_back(std::move(entry));

                if (batch.size() >= chunkSize) {
                    const std::size_t count = batch.size();
                    sink.Store(std::move(batch));
                    result.imported += count;
                    batch = std::vector<CatalogEntry>();
                    batch.reserve(chunkSize);
                }
            }
            if (!batch.empty()) {
                const std::size_t count = batch.size();
                sink.Store(std::move(batch));
                result.imported += count;
            }
            sink.Commit();

            result.fallbackDecoded = stream.fallbackDecodedCount();
            result.success = true;
            LOG_DEBUG("Import: %s done, %llu imported, %llu skipped, %llu duplicates, %llu decoded with fallback\n",
                dump.string().c_str(), static_cast<unsigned long long>(result.imported),
                static_cast<unsigned long long>(result.skipped), static_cast<unsigned long long>(result.duplicates),
                static_cast<unsigned long long>(result.fallbackDecoded));
        } catch (const Error& e) {
            result.error = std::string(ErrorKindName(e.kind())) + ": " + e.what();
            LOG_DEBUG("Import failed: %s\n", result.error.c_str());
        } catch (const std::exception& e) {
            result.error = e.what();
            LOG_DEBUG("Import failed: %s\n", result.error.c_str());
        }
        return result;
    }
}
