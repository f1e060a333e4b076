#include <deltapdf/Pl_Count.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/Util.hh>

using namespace deltapdf;

Pl_Count::Pl_Count(char const* identifier, Pipeline* next, dpdf_offset_t initial_count) :
    Pipeline(identifier, next),
    count(initial_count)
{
    util::assertion(next, "Attempt to create Pl_Count with nullptr as next");
}

Pl_Count::~Pl_Count() = default;

void
Pl_Count::write(unsigned char const* buf, size_t len)
{
    if (len) {
        count += DIntC::to_offset(len);
        last_char = buf[len - 1];
        next()->write(buf, len);
    }
}

void
Pl_Count::finish()
{
    next()->finish();
}

dpdf_offset_t
Pl_Count::getCount() const
{
    return count;
}

unsigned char
Pl_Count::getLastChar() const
{
    return last_char;
}
