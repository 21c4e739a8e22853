#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>
#include "inpx/catalog_record.hpp"

namespace flib::catalog
{
    // A parsed record with its author strings split and archives resolved.
    struct CatalogEntry {
        inpx::CatalogRecord record;
        std::vector<inpx::AuthorName> authorNames;
    };

    // Where imported records end up. Implementations own persistence and
    // querying.
    class CatalogSink
    {
        public:
            virtual ~CatalogSink() = default;

            virtual bool Contains(std::uint64_t libId) const = 0;
            // Entries arrive with unique IDs the sink does not hold yet.
            virtual void Store(std::vector<CatalogEntry> batch) = 0;
            virtual void Commit() = 0;
    };

    // Sink kept in memory, keyed by ID. Entries stored after the last Commit()
    // are visible to Contains() but not to Find().
    class MemoryCatalog : public CatalogSink
    {
        public:
            bool Contains(std::uint64_t libId) const override;
            void Store(std::vector<CatalogEntry> batch) override;
            void Commit() override;

            const CatalogEntry* Find(std::uint64_t libId) const;
            std::size_t size() const { return m_committed.size(); }
            std::size_t batchesStored() const { return m_batches; }
            std::size_t commits() const { return m_commits; }

        private:
            std::map<std::uint64_t, CatalogEntry> m_committed;
            std::map<std::uint64_t, CatalogEntry> m_pending;
            std::size_t m_batches = 0;
            std::size_t m_commits = 0;
    };
}
