#include <deltapdf/DPDFIncrementalWriter.hh>

#include <deltapdf/BufferInputSource.hh>
#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFTokenizer.hh>
#include <deltapdf/DUtil.hh>
#include <deltapdf/ObjectWriter.hh>
#include <deltapdf/Pl_Count.hh>
#include <deltapdf/Pl_String.hh>

#include <algorithm>
#include <stdexcept>

using namespace deltapdf;

namespace
{
    class StartxrefFinder final: public InputSource::Finder
    {
      public:
        StartxrefFinder(InputSource& input) :
            input(input)
        {
        }
        ~StartxrefFinder() final = default;

        bool
        check() final
        {
            if (tokenizer.readToken(input, "", true).isWord("startxref") &&
                tokenizer.readToken(input, "", true).isInteger()) {
                input.seek(input.getLastOffset(), SEEK_SET);
                return true;
            }
            return false;
        }

      private:
        InputSource& input;
        DPDFTokenizer tokenizer;
    };
} // namespace

// Return the offset written after the last startxref keyword in the file.
static dpdf_offset_t
find_prev_startxref(std::string const& original)
{
    BufferInputSource input("original file", original);
    input.seek(0, SEEK_END);
    dpdf_offset_t end_offset = input.tell();
    dpdf_offset_t start_offset = (end_offset > 1054 ? end_offset - 1054 : 0);
    StartxrefFinder sf(input);
    if (!input.findLast("startxref", start_offset, 0, sf)) {
        throw DPDFExc(
            dpdf_e_invalid_xref, "original file", "", 0, "can't find startxref in original file");
    }
    auto t = DPDFTokenizer().readToken(input, "original file", true);
    try {
        return DUtil::string_to_ll(t.getValue().c_str());
    } catch (std::range_error&) {
        throw DPDFExc(
            dpdf_e_invalid_xref,
            "original file",
            "",
            t.getOffset(),
            "startxref offset in original file is out of range");
    }
}

class DPDFIncrementalWriter::Members
{
    friend class DPDFIncrementalWriter;

  public:
    Members(DPDF& pdf) :
        pdf(pdf)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    DPDF& pdf;
    std::map<int, std::string> changes;
    bool update_id{false};
};

DPDFIncrementalWriter::DPDFIncrementalWriter(DPDF& pdf) :
    m(new Members(pdf))
{
}

DPDFIncrementalWriter::~DPDFIncrementalWriter() = default;

void
DPDFIncrementalWriter::replaceObject(int objid, DPDFObjectHandle const& value)
{
    if (!value.isInitialized()) {
        throw std::logic_error(
            "DPDFIncrementalWriter::replaceObject called with uninitialized object");
    }
    replaceObject(objid, value.unparseResolved());
}

void
DPDFIncrementalWriter::replaceObject(int objid, std::string const& serialized)
{
    if (objid < 1) {
        throw std::logic_error(
            "DPDFIncrementalWriter::replaceObject called with invalid object number " +
            std::to_string(objid));
    }
    m->changes[objid] = serialized;
}

size_t
DPDFIncrementalWriter::getChangeCount() const
{
    return m->changes.size();
}

void
DPDFIncrementalWriter::setUpdateID(bool val)
{
    m->update_id = val;
}

std::string
DPDFIncrementalWriter::write()
{
    if (m->changes.empty()) {
        return *m->pdf.getBuffer();
    }
    return writeUpdate(
        *m->pdf.getBuffer(),
        m->changes,
        m->pdf.getTrailer(),
        m->pdf.getNextObjectId(),
        m->update_id);
}

void
DPDFIncrementalWriter::writeFile(char const* filename)
{
    DUtil::write_string_to_file(filename, write());
}

std::string
DPDFIncrementalWriter::writeUpdate(
    std::string const& original,
    std::map<int, std::string> const& changes,
    DPDFObjectHandle const& trailer,
    int next_object_id,
    bool update_id)
{
    if (changes.empty()) {
        return original;
    }
    if (!trailer.isDictionary()) {
        throw std::logic_error(
            "DPDFIncrementalWriter::writeUpdate called without a trailer dictionary");
    }
    dpdf_offset_t prev = find_prev_startxref(original);

    std::string delta;
    Pl_String pl_delta("delta", nullptr, delta);
    Pl_Count pl_count("count", &pl_delta, static_cast<dpdf_offset_t>(original.size()));
    Pipeline& p = pl_count;

    if (original.empty() || original.back() != '\n') {
        p << "\n";
    }

    writer::offsets_t offsets;
    offsets.reserve(changes.size());
    for (auto const& [objid, value]: changes) {
        writer::write_object(pl_count, objid, value, offsets);
    }

    dpdf_offset_t xref_offset = pl_count.getCount();
    writer::write_xref_table(p, offsets, false);

    auto new_trailer = DPDFObjectHandle::newDictionary();
    int size = std::max(next_object_id, offsets.back().first + 1);
    new_trailer.replaceKey("/Size", DPDFObjectHandle::newInteger(size));
    for (auto const& key: {"/Root", "/Info", "/Encrypt", "/ID"}) {
        if (trailer.hasKey(key)) {
            new_trailer.replaceKey(key, trailer.getKey(key));
        }
    }
    auto id = new_trailer.getKey("/ID");
    if (update_id && id.isArray() && id.getArrayNItems() == 2 && id.getArrayItem(0).isString()) {
        auto new_id = DPDFObjectHandle::newArray();
        new_id.appendItem(id.getArrayItem(0));
        auto seed = id.getArrayItem(0).getStringValue() + delta + std::to_string(prev);
        new_id.appendItem(DPDFObjectHandle::newHexString(writer::md5_digest(seed)));
        new_trailer.replaceKey("/ID", new_id);
    }
    new_trailer.replaceKey("/Prev", DPDFObjectHandle::newInteger(prev));

    p << "trailer\n" << new_trailer.unparseResolved() << "\n";
    p << "startxref\n" << std::to_string(xref_offset) << "\n%%EOF\n";
    p.finish();

    return original + delta;
}
