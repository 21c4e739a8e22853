#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "inpx/catalog_record.hpp"

namespace flib::fb2
{
    extern const char* const kDefaultCoverId;

    // One <binary> block to be appended to the document.
    struct BinaryAsset {
        std::string id;
        std::string contentType;
        std::vector<std::uint8_t> data;
    };

    // Content type from the file name extension; extensionless names are
    // treated as JPEG.
    std::string ContentTypeFor(const std::string& fileName);

    // "<libid>.<ext>", with "fb2" when the record has no extension.
    std::string PayloadMemberName(const inpx::CatalogRecord& record);

    // Reads the payload named by the record, embeds its cover and illustrations
    // from the resolved asset archives and returns the UTF-8 document. Missing
    // assets are left out. Throws flib::Error: MissingPayload when no payload
    // archive is resolved, NotFound when the archive or member is absent.
    std::vector<std::uint8_t> AssembleFb2(const inpx::CatalogRecord& record);
}
