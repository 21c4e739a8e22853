#include "fb2/assembler.hpp"

#include <algorithm>
#include <cstring>
#include <map>
#include <pugixml.hpp>
#include <set>
#include <utility>
#include "archive/member_extractor.hpp"
#include "util/config.hpp"
#include "util/encoding.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

namespace flib::fb2
{
    const char* const kDefaultCoverId = "cover.jpg";

    namespace {
        const char* const kXlinkNamespace = "http://www.w3.org/1999/xlink";
        const char* const kDefaultXlinkPrefix = "l";
        constexpr std::size_t kDeclarationScanLimit = 1024;

        class VectorWriter : public pugi::xml_writer
        {
            public:
                explicit VectorWriter(std::vector<std::uint8_t>& out) : m_out(out) {}

                void write(const void* data, size_t size) override
                {
                    const auto* bytes = static_cast<const std::uint8_t*>(data);
                    m_out.insert(m_out.end(), bytes, bytes + size);
                }

            private:
                std::vector<std::uint8_t>& m_out;
        };

        const char* LocalName(const char* name)
        {
            const char* colon = std::strchr(name, ':');
            return colon ? colon + 1 : name;
        }

        std::string PrefixOf(const char* name)
        {
            const char* colon = std::strchr(name, ':');
            return colon ? std::string(name, colon - name + 1) : std::string();
        }

        bool HasLocalName(const pugi::xml_node& node, const char* local)
        {
            return node.type() == pugi::node_element && std::strcmp(LocalName(node.name()), local) == 0;
        }

        pugi::xml_node ChildByLocalName(const pugi::xml_node& parent, const char* local)
        {
            for (pugi::xml_node child : parent.children()) {
                if (HasLocalName(child, local))
                    return child;
            }
            return pugi::xml_node();
        }

        std::string BaseName(const std::string& member)
        {
            const std::size_t slash = member.find_last_of('/');
            return slash == std::string::npos ? member : member.substr(slash + 1);
        }

        // Encoding named by the XML declaration, lower-cased; empty if none.
        std::string DeclaredEncoding(const std::vector<std::uint8_t>& raw)
        {
            const std::size_t scan = std::min(raw.size(), kDeclarationScanLimit);
            const std::string head(reinterpret_cast<const char*>(raw.data()), scan);
            if (head.find("<?xml") == std::string::npos)
                return "";
            const std::size_t declEnd = head.find("?>");
            const std::size_t attr = head.find("encoding");
            if (attr == std::string::npos || (declEnd != std::string::npos && attr > declEnd))
                return "";
            const std::size_t quote = head.find_first_of("\"'", attr);
            if (quote == std::string::npos)
                return "";
            const std::size_t close = head.find(head[quote], quote + 1);
            if (close == std::string::npos)
                return "";
            return util::toLower(util::trim(head.substr(quote + 1, close - quote - 1)));
        }

        std::string PayloadToUtf8(const std::vector<std::uint8_t>& raw, const std::string& member)
        {
            const char* data = reinterpret_cast<const char*>(raw.data());
            std::size_t size = raw.size();
            if (size >= 3 && std::memcmp(data, "\xEF\xBB\xBF", 3) == 0) {
                data += 3;
                size -= 3;
            }

            const std::string declared = DeclaredEncoding(raw);
            if (!declared.empty() && declared != "utf-8" && declared != "utf8") {
                std::string converted;
                if (util::legacyToUtf8(data, size, declared, converted))
                    return converted;
                LOG_DEBUG("Assembler: %s declares unknown encoding %s\n", member.c_str(), declared.c_str());
            }

            bool usedFallback = false;
            std::string text = util::decodeText(data, size, config::fallbackEncoding, usedFallback);
            if (usedFallback)
                LOG_DEBUG("Assembler: %s is not valid UTF-8, decoded as %s\n", member.c_str(), config::fallbackEncoding.c_str());
            return text;
        }

        // Namespace URI bound to prefix in scope at node; empty if unbound.
        const char* NamespaceOf(pugi::xml_node node, const std::string& prefix)
        {
            const std::string declName = "xmlns:" + prefix;
            for (; node; node = node.parent()) {
                const pugi::xml_attribute decl = node.attribute(declName.c_str());
                if (decl)
                    return decl.value();
            }
            return "";
        }

        // The href attribute of node in the XLink namespace, whatever its prefix.
        pugi::xml_attribute XlinkHref(const pugi::xml_node& node)
        {
            for (pugi::xml_attribute attr : node.attributes()) {
                const char* name = attr.name();
                if (std::strcmp(LocalName(name), "href") != 0)
                    continue;
                std::string prefix = PrefixOf(name);
                if (prefix.size() < 2)
                    continue;
                prefix.pop_back();
                if (prefix != "xmlns" && std::strcmp(NamespaceOf(node, prefix), kXlinkNamespace) == 0)
                    return attr;
            }
            return pugi::xml_attribute();
        }

        // Qualified href name for new attributes: the first XLink prefix
        // declared on the root, else a free prefix declared there.
        std::string XlinkHrefName(pugi::xml_node root)
        {
            for (pugi::xml_attribute attr : root.attributes()) {
                const std::string name = attr.name();
                if (name.rfind("xmlns:", 0) == 0 && std::strcmp(attr.value(), kXlinkNamespace) == 0)
                    return name.substr(6) + ":href";
            }
            std::string prefix = kDefaultXlinkPrefix;
            for (int n = 2; root.attribute(("xmlns:" + prefix).c_str()); n++)
                prefix = kDefaultXlinkPrefix + std::to_string(n);
            root.append_attribute(("xmlns:" + prefix).c_str()).set_value(kXlinkNamespace);
            return prefix + ":href";
        }

        class ImageCollector : public pugi::xml_tree_walker
        {
            public:
                bool for_each(pugi::xml_node& node) override
                {
                    if (!HasLocalName(node, "image"))
                        return true;
                    const char* href = XlinkHref(node).value();
                    if (href[0] != '#' || href[1] == '\0')
                        return true;
                    std::string id(href + 1);
                    if (m_seen.insert(id).second)
                        m_ids.push_back(std::move(id));
                    return true;
                }

                const std::vector<std::string>& ids() const { return m_ids; }

            private:
                std::set<std::string> m_seen;
                std::vector<std::string> m_ids;
        };

        std::set<std::string> EmbeddedBinaryIds(const pugi::xml_node& root)
        {
            std::set<std::string> ids;
            for (pugi::xml_node child : root.children()) {
                if (HasLocalName(child, "binary"))
                    ids.insert(child.attribute("id").value());
            }
            return ids;
        }

        bool ReadCover(const std::filesystem::path& archivePath, const std::string& libId, const std::string& coverId, BinaryAsset& out)
        {
            try {
                const archive::ArchiveHandle handle = archive::OpenArchive(archivePath);
                const std::vector<archive::MemberInfo> members = archive::ListMembers(handle);

                std::string chosen;
                for (const std::string& wanted : {libId, libId + ".jpg"}) {
                    for (const auto& info : members) {
                        if (!info.isDirectory && BaseName(info.name) == wanted) {
                            chosen = info.name;
                            break;
                        }
                    }
                    if (!chosen.empty())
                        break;
                }
                if (chosen.empty()) {
                    for (const auto& info : members) {
                        if (!info.isDirectory) {
                            chosen = info.name;
                            break;
                        }
                    }
                }
                if (chosen.empty()) {
                    LOG_DEBUG("Assembler: cover archive %s is empty\n", archivePath.string().c_str());
                    return false;
                }

                auto stream = archive::OpenMember(handle, chosen);
                out.id = coverId;
                out.contentType = ContentTypeFor(stream->name());
                out.data = stream->ReadAll();
                if (out.data.empty()) {
                    LOG_DEBUG("Assembler: cover %s in %s is empty\n", chosen.c_str(), archivePath.string().c_str());
                    return false;
                }
                return true;
            } catch (const std::exception& e) {
                LOG_DEBUG("Assembler: cover for %s not embedded: %s\n", libId.c_str(), e.what());
                return false;
            }
        }

        void ReadIllustrations(const std::filesystem::path& archivePath, const std::string& libId,
            const std::vector<std::string>& ids, std::set<std::string>& recorded, std::vector<BinaryAsset>& out)
        {
            try {
                const archive::ArchiveHandle handle = archive::OpenArchive(archivePath);

                // Members under "<libid>/", keyed by file name.
                std::map<std::string, std::string> byBaseName;
                for (const auto& info : archive::ListMembers(handle)) {
                    if (info.isDirectory)
                        continue;
                    const std::vector<std::string> segments = util::splitString(info.name, '/', true);
                    if (segments.size() < 2 || segments.front() != libId)
                        continue;
                    byBaseName.emplace(segments.back(), info.name);
                }

                for (const auto& id : ids) {
                    if (recorded.count(id) != 0)
                        continue;
                    auto found = byBaseName.end();
                    for (const std::string& variant : {id, id + ".jpg", id + ".png", id + ".gif"}) {
                        found = byBaseName.find(variant);
                        if (found != byBaseName.end())
                            break;
                    }
                    if (found == byBaseName.end()) {
                        LOG_DEBUG("Assembler: illustration %s not found for %s\n", id.c_str(), libId.c_str());
                        continue;
                    }
                    try {
                        BinaryAsset asset;
                        asset.id = id;
                        asset.contentType = ContentTypeFor(found->second);
                        asset.data = archive::OpenMember(handle, found->second)->ReadAll();
                        recorded.insert(id);
                        out.push_back(std::move(asset));
                    } catch (const std::exception& e) {
                        LOG_DEBUG("Assembler: illustration %s for %s not embedded: %s\n", id.c_str(), libId.c_str(), e.what());
                    }
                }
            } catch (const std::exception& e) {
                LOG_DEBUG("Assembler: illustration archive %s unusable: %s\n", archivePath.string().c_str(), e.what());
            }
        }

        void InsertCoverpage(pugi::xml_node titleInfo, const std::string& hrefName, const std::string& coverId)
        {
            const std::string prefix = PrefixOf(titleInfo.name());
            pugi::xml_node before;
            for (pugi::xml_node child : titleInfo.children()) {
                if (HasLocalName(child, "lang") || HasLocalName(child, "src-lang") ||
                    HasLocalName(child, "translator") || HasLocalName(child, "sequence")) {
                    before = child;
                    break;
                }
            }
            const std::string coverpageName = prefix + "coverpage";
            pugi::xml_node coverpage = before ? titleInfo.insert_child_before(coverpageName.c_str(), before)
                                              : titleInfo.append_child(coverpageName.c_str());
            pugi::xml_node image = coverpage.append_child((prefix + "image").c_str());
            image.append_attribute(hrefName.c_str()).set_value(("#" + coverId).c_str());
        }
    }

    std::string ContentTypeFor(const std::string& fileName)
    {
        const std::string base = BaseName(fileName);
        const std::size_t dot = base.find_last_of('.');
        if (dot == std::string::npos || dot + 1 == base.size())
            return "image/jpeg";
        const std::string ext = util::toLower(base.substr(dot + 1));
        if (ext == "jpg" || ext == "jpeg")
            return "image/jpeg";
        if (ext == "png")
            return "image/png";
        if (ext == "gif")
            return "image/gif";
        return "application/octet-stream";
    }

    std::string PayloadMemberName(const inpx::CatalogRecord& record)
    {
        const std::string ext = util::trim(record.fileExt);
        return std::to_string(record.libId) + "." + (ext.empty() ? std::string("fb2") : ext);
    }

    std::vector<std::uint8_t> AssembleFb2(const inpx::CatalogRecord& record)
    {
        if (!record.hasLibId || record.payloadArchive.empty())
            THROW_ERROR(ErrorKind::MissingPayload, record.payloadArchive.string(), "",
                "no payload archive resolved for record %s", record.hasLibId ? std::to_string(record.libId).c_str() : "<no id>");

        const std::string libId = std::to_string(record.libId);
        const std::string member = PayloadMemberName(record);
        const std::string archiveText = record.payloadArchive.string();
        const std::vector<std::uint8_t> raw = archive::OpenMember(record.payloadArchive, member)->ReadAll();
        const std::string text = PayloadToUtf8(raw, member);

        pugi::xml_document doc;
        const pugi::xml_parse_result parsed = doc.load_buffer(text.data(), text.size(),
            pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata, pugi::encoding_utf8);
        if (!parsed)
            THROW_ERROR(ErrorKind::UnsupportedFormat, archiveText, member, "%s in %s is not well-formed XML: %s at offset %td",
                member.c_str(), archiveText.c_str(), parsed.description(), parsed.offset);

        pugi::xml_node root = doc.document_element();
        const std::string rootPrefix = PrefixOf(root.name());

        pugi::xml_node titleInfo = ChildByLocalName(ChildByLocalName(root, "description"), "title-info");
        pugi::xml_node coverImage = ChildByLocalName(ChildByLocalName(titleInfo, "coverpage"), "image");

        std::string coverId = kDefaultCoverId;
        if (coverImage) {
            const std::string href = XlinkHref(coverImage).value();
            if (href.size() > 1 && href[0] == '#')
                coverId = href.substr(1);
        }

        std::set<std::string> recorded = EmbeddedBinaryIds(root);
        std::vector<BinaryAsset> assets;

        if (!record.coverArchive.empty() && recorded.count(coverId) == 0) {
            BinaryAsset cover;
            if (ReadCover(record.coverArchive, libId, coverId, cover)) {
                recorded.insert(cover.id);
                assets.push_back(std::move(cover));
            }
        }

        if (coverImage) {
            pugi::xml_attribute href = XlinkHref(coverImage);
            if (!href)
                href = coverImage.append_attribute(XlinkHrefName(root).c_str());
            href.set_value(("#" + coverId).c_str());
        } else if (titleInfo) {
            InsertCoverpage(titleInfo, XlinkHrefName(root), coverId);
        }

        if (!record.illustrationArchive.empty()) {
            ImageCollector collector;
            doc.traverse(collector);
            if (!collector.ids().empty())
                ReadIllustrations(record.illustrationArchive, libId, collector.ids(), recorded, assets);
        }

        for (const auto& asset : assets) {
            pugi::xml_node binary = root.append_child((rootPrefix + "binary").c_str());
            binary.append_attribute("id").set_value(asset.id.c_str());
            binary.append_attribute("content-type").set_value(asset.contentType.c_str());
            binary.text().set(util::base64Encode(asset.data).c_str());
        }

        for (pugi::xml_node node = doc.first_child(); node;) {
            pugi::xml_node next = node.next_sibling();
            if (node.type() == pugi::node_declaration)
                doc.remove_child(node);
            node = next;
        }
        pugi::xml_node declaration = doc.prepend_child(pugi::node_declaration);
        declaration.append_attribute("version").set_value("1.0");
        declaration.append_attribute("encoding").set_value("utf-8");

        std::vector<std::uint8_t> out;
        VectorWriter writer(out);
        doc.save(writer, "", pugi::format_raw, pugi::encoding_utf8);
        LOG_DEBUG("Assembler: %s from %s, %zu binaries, %zu bytes\n", member.c_str(), archiveText.c_str(), assets.size(), out.size());
        return out;
    }
}
