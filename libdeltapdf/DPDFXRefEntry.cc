#include <deltapdf/DPDFXRefEntry.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/Util.hh>

using namespace deltapdf;

DPDFXRefEntry::DPDFXRefEntry() = default;

DPDFXRefEntry::DPDFXRefEntry(int type, dpdf_offset_t field1, int field2) :
    type(type),
    field1(field1),
    field2(field2)
{
    util::assertion(type >= 0 && type <= 2, "invalid xref type " + std::to_string(type));
}

int
DPDFXRefEntry::getType() const
{
    return type;
}

dpdf_offset_t
DPDFXRefEntry::getOffset() const
{
    util::assertion(type == 1, "getOffset called for xref entry of type != 1");
    return field1;
}

int
DPDFXRefEntry::getGeneration() const
{
    return type == 2 ? 0 : field2;
}

int
DPDFXRefEntry::getObjStreamNumber() const
{
    util::assertion(type == 2, "getObjStreamNumber called for xref entry of type != 2");
    return DIntC::to_int(field1);
}

int
DPDFXRefEntry::getObjStreamIndex() const
{
    util::assertion(type == 2, "getObjStreamIndex called for xref entry of type != 2");
    return field2;
}

bool
DPDFXRefEntry::operator==(DPDFXRefEntry const& rhs) const
{
    if (type != rhs.type) {
        return false;
    }
    if (type == 0) {
        // The free list links carry no information about where an object lives.
        return true;
    }
    return field1 == rhs.field1 && field2 == rhs.field2;
}

std::string
DPDFXRefEntry::unparse() const
{
    if (type == 0) {
        return "0";
    }
    return std::to_string(type) + "/" + std::to_string(field1) + "/" + std::to_string(field2);
}
