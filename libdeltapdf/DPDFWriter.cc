#include <deltapdf/DPDFWriter.hh>

#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/DUtil.hh>
#include <deltapdf/ObjectWriter.hh>
#include <deltapdf/Pl_Count.hh>
#include <deltapdf/Pl_Flate.hh>
#include <deltapdf/Pl_String.hh>

#include <ctime>
#include <map>
#include <optional>
#include <stdexcept>

using namespace deltapdf;

namespace
{
    // Sets the Pl_Flate compression level for the life of the object.
    class CompressionLevel
    {
      public:
        CompressionLevel(std::optional<int> level) :
            saved(Pl_Flate::getCompressionLevel())
        {
            if (level) {
                Pl_Flate::setCompressionLevel(*level);
            }
        }
        CompressionLevel(CompressionLevel const&) = delete;
        CompressionLevel& operator=(CompressionLevel const&) = delete;
        ~CompressionLevel()
        {
            Pl_Flate::setCompressionLevel(saved);
        }

      private:
        int saved;
    };

    std::string
    pdf_time_now()
    {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        if (gmtime_r(&now, &tm) == nullptr) {
            throw std::runtime_error("unable to convert the current time");
        }
        char buf[32];
        std::strftime(buf, sizeof(buf), "D:%Y%m%d%H%M%SZ", &tm);
        return buf;
    }
} // namespace

class DPDFWriter::Members
{
    friend class DPDFWriter;

  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    std::string version{"1.7"};
    dpdf_xref_format_e xref_format{dpdf_xref_table};
    bool compress{true};
    std::optional<int> compression_level;
    std::map<int, DPDFObjectHandle> objects;
    int next_objid{1};
    DPDFObjectHandle root;
    DPDFObjectHandle info;
    DPDFObjectHandle encrypt;
};

DPDFWriter::DPDFWriter() :
    m(new Members())
{
}

DPDFWriter::~DPDFWriter() = default;

std::shared_ptr<DPDFWriter>
DPDFWriter::createMinimalDocument()
{
    auto w = std::make_shared<DPDFWriter>();

    auto page = DPDFObjectHandle::parse("<< /Type /Page /MediaBox [ 0 0 612 792 ] >>");
    auto page_ref = w->addObject(page);

    auto pages = DPDFObjectHandle::newDictionary();
    pages.replaceKey("/Type", DPDFObjectHandle::newName("/Pages"));
    pages.replaceKey("/Kids", DPDFObjectHandle::newArray({page_ref}));
    pages.replaceKey("/Count", DPDFObjectHandle::newInteger(1));
    auto pages_ref = w->addObject(pages);
    page.replaceKey("/Parent", pages_ref);

    auto catalog = DPDFObjectHandle::newDictionary();
    catalog.replaceKey("/Pages", pages_ref);
    w->setCatalog(catalog);

    auto info = DPDFObjectHandle::newDictionary();
    info.replaceKey("/Producer", DPDFObjectHandle::newString("deltapdf"));
    info.replaceKey("/CreationDate", DPDFObjectHandle::newString(pdf_time_now()));
    w->setInfo(info);

    return w;
}

void
DPDFWriter::setVersion(std::string const& version)
{
    m->version = version;
}

std::string
DPDFWriter::getVersion() const
{
    return m->version;
}

void
DPDFWriter::setXrefFormat(dpdf_xref_format_e format)
{
    m->xref_format = format;
}

void
DPDFWriter::setCompression(bool val)
{
    m->compress = val;
}

void
DPDFWriter::setCompressionLevel(int level)
{
    if (level < -1 || level > 9) {
        throw std::logic_error(
            "DPDFWriter::setCompressionLevel called with invalid level " + std::to_string(level));
    }
    m->compression_level = level;
}

DPDFObjectHandle
DPDFWriter::addObject(DPDFObjectHandle const& obj)
{
    if (!obj.isInitialized()) {
        throw std::logic_error("DPDFWriter::addObject called with uninitialized object");
    }
    int objid = m->next_objid++;
    m->objects[objid] = obj;
    return DPDFObjectHandle::newReference(objid, 0);
}

DPDFObjectHandle
DPDFWriter::setCatalog(DPDFObjectHandle catalog)
{
    if (!catalog.isDictionary()) {
        throw std::logic_error("DPDFWriter::setCatalog called with a non-dictionary");
    }
    catalog.replaceKey("/Type", DPDFObjectHandle::newName("/Catalog"));
    m->root = addObject(catalog);
    return m->root;
}

DPDFObjectHandle
DPDFWriter::setInfo(DPDFObjectHandle const& info)
{
    if (!info.isDictionary()) {
        throw std::logic_error("DPDFWriter::setInfo called with a non-dictionary");
    }
    m->info = addObject(info);
    return m->info;
}

DPDFObjectHandle
DPDFWriter::setEncrypt(DPDFObjectHandle const& encrypt)
{
    if (!encrypt.isDictionary()) {
        throw std::logic_error("DPDFWriter::setEncrypt called with a non-dictionary");
    }
    m->encrypt = addObject(encrypt);
    return m->encrypt;
}

DPDFObjectHandle
DPDFWriter::getObject(int objid) const
{
    auto iter = m->objects.find(objid);
    if (iter == m->objects.end()) {
        return DPDFObjectHandle::newNull();
    }
    return iter->second;
}

int
DPDFWriter::getNextObjectId() const
{
    return m->next_objid;
}

void
DPDFWriter::reset()
{
    m->objects.clear();
    m->next_objid = 1;
    m->root = DPDFObjectHandle();
    m->info = DPDFObjectHandle();
    m->encrypt = DPDFObjectHandle();
}

std::string
DPDFWriter::serialize(DPDFObjectHandle const& obj) const
{
    if (!(m->compress && obj.isStream() && !obj.getDict().hasKey("/Filter"))) {
        return obj.unparseResolved();
    }
    auto flate = DPDFObjectHandle::newName("/FlateDecode");
    auto dict = obj.getDict().shallowCopy();
    dict.replaceKey("/Filter", flate);
    return DPDFObjectHandle::newStream(
               dict, DPDFStreamFilter::encode(obj.getRawStreamData(), flate, "stream data"))
        .unparseResolved();
}

std::string
DPDFWriter::write()
{
    if (!m->root.isInitialized()) {
        throw std::logic_error("DPDFWriter::write called before setCatalog");
    }

    std::string result;
    Pl_String pl_result("pdf", nullptr, result);
    Pl_Count pl_count("count", &pl_result);
    Pipeline& p = pl_count;
    CompressionLevel level(m->compression_level);

    // The comment's high-bit bytes mark the file as binary.
    p << "%PDF-" << m->version << "\n%\xe2\xe3\xcf\xd3\n";

    writer::offsets_t offsets;
    offsets.reserve(m->objects.size());
    for (auto const& [objid, obj]: m->objects) {
        writer::write_object(pl_count, objid, serialize(obj), offsets);
    }

    auto trailer = DPDFObjectHandle::newDictionary();
    trailer.replaceKey("/Size", DPDFObjectHandle::newInteger(m->next_objid));
    trailer.replaceKey("/Root", m->root);
    if (m->info.isInitialized()) {
        trailer.replaceKey("/Info", m->info);
    }
    auto id = DPDFObjectHandle::newHexString(writer::md5_digest(result));
    trailer.replaceKey("/ID", DPDFObjectHandle::newArray({id, id}));
    if (m->encrypt.isInitialized()) {
        trailer.replaceKey("/Encrypt", m->encrypt);
    }

    dpdf_offset_t xref_offset = 0;
    if (m->xref_format == dpdf_xref_stream) {
        xref_offset =
            writer::write_xref_stream(pl_count, m->next_objid, offsets, true, trailer);
    } else {
        xref_offset = pl_count.getCount();
        writer::write_xref_table(p, offsets, true);
        p << "trailer\n" << trailer.unparseResolved() << "\n";
    }
    p << "startxref\n" << std::to_string(xref_offset) << "\n%%EOF\n";
    p.finish();
    return result;
}

void
DPDFWriter::writeFile(char const* filename)
{
    DUtil::write_string_to_file(filename, write());
}
