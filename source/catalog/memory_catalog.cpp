#include "catalog/catalog_sink.hpp"

#include <utility>
#include "util/error.hpp"

namespace flib::catalog
{
    bool MemoryCatalog::Contains(std::uint64_t libId) const
    {
        return m_committed.count(libId) != 0 || m_pending.count(libId) != 0;
    }

    void MemoryCatalog::Store(std::vector<CatalogEntry> batch)
    {
        for (auto& entry : batch) {
            const std::uint64_t libId = entry.record.libId;
            if (!entry.record.hasLibId)
                THROW_FORMAT("record without id handed to the catalog");
            if (Contains(libId)) {
                LOG_DEBUG("Catalog: %llu already stored, ignored\n", static_cast<unsigned long long>(libId));
                continue;
            }
            m_pending.emplace(libId, std::move(entry));
        }
        m_batches++;
    }

    void MemoryCatalog::Commit()
    {
        for (auto& item : m_pending)
            m_committed.insert_or_assign(item.first, std::move(item.second));
        m_pending.clear();
        m_commits++;
    }

    const CatalogEntry* MemoryCatalog::Find(std::uint64_t libId) const
    {
        auto it = m_committed.find(libId);
        return it == m_committed.end() ? nullptr : &it->second;
    }
}
