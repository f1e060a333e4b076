#ifndef OBJECTWRITER_HH
#define OBJECTWRITER_HH

#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/Pl_Count.hh>
#include <deltapdf/Types.h>

#include <string>
#include <utility>
#include <vector>

// Serialization shared by DPDFWriter and DPDFIncrementalWriter. Everything is written with
// generation 0.
namespace deltapdf::writer
{
    // Object numbers with the offsets of their "n 0 obj" lines, sorted by object number
    using offsets_t = std::vector<std::pair<int, dpdf_offset_t>>;

    // Write value as indirect object objid and record its offset in offsets.
    void write_object(Pl_Count& p, int objid, std::string const& value, offsets_t& offsets);

    // Write an "xref" section with one subsection for each run of consecutive object numbers.
    // With free_head, object 0 is written first as the head of the free list.
    void write_xref_table(Pipeline& p, offsets_t const& offsets, bool free_head);

    // Write the same entries as a cross-reference stream numbered objid, placed at the current
    // offset. The stream's own entry is included. The keys of trailer other than /Size are copied
    // into the stream dictionary. Return the offset of the stream object.
    dpdf_offset_t write_xref_stream(
        Pl_Count& p,
        int objid,
        offsets_t offsets,
        bool free_head,
        DPDFObjectHandle const& trailer);

    // Number of bytes needed to hold value in a cross-reference stream field
    int field_width(dpdf_offset_t value);

    std::string md5_digest(std::string const& data);
} // namespace deltapdf::writer

#endif // OBJECTWRITER_HH
