#include <deltapdf/ObjectWriter.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/DUtil.hh>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace deltapdf;

namespace
{
    // Object 0 in a row list; it has no offset.
    constexpr dpdf_offset_t free_head_row = -1;

    writer::offsets_t
    rows(writer::offsets_t const& offsets, bool free_head)
    {
        writer::offsets_t result;
        if (free_head) {
            result.emplace_back(0, free_head_row);
        }
        result.insert(result.end(), offsets.begin(), offsets.end());
        return result;
    }

    // Calls f(first, count) for each run of consecutive object numbers.
    template <typename F>
    void
    for_each_subsection(writer::offsets_t const& rows, F f)
    {
        for (size_t i = 0; i < rows.size();) {
            size_t j = i + 1;
            while (j < rows.size() && rows[j].first == rows[j - 1].first + 1) {
                ++j;
            }
            f(i, j - i);
            i = j;
        }
    }

    void
    check_openssl(int status)
    {
        if (status != 1) {
            // OpenSSL creates a "queue" of errors; copy the first (innermost) error to the
            // exception message.
            char buf[256] = "";
            ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
            std::string what = "OpenSSL error: ";
            what += buf;
            throw std::runtime_error(what);
        }
        ERR_clear_error();
    }
} // namespace

void
writer::write_object(Pl_Count& p, int objid, std::string const& value, offsets_t& offsets)
{
    offsets.emplace_back(objid, p.getCount());
    p << std::to_string(objid) << " 0 obj\n" << value << "\nendobj\n";
}

void
writer::write_xref_table(Pipeline& p, offsets_t const& offsets, bool free_head)
{
    auto all = rows(offsets, free_head);
    p << "xref\n";
    for_each_subsection(all, [&p, &all](size_t first, size_t count) {
        p << std::to_string(all[first].first) << " " << std::to_string(count) << "\n";
        for (size_t i = first; i < first + count; ++i) {
            if (all[i].second == free_head_row) {
                p << "0000000000 65535 f \n";
            } else {
                p << DUtil::int_to_string(all[i].second, 10) << " 00000 n \n";
            }
        }
    });
}

int
writer::field_width(dpdf_offset_t value)
{
    int width = 1;
    while (width < 8 && (value >> (8 * width)) != 0) {
        ++width;
    }
    return width;
}

dpdf_offset_t
writer::write_xref_stream(
    Pl_Count& p, int objid, offsets_t offsets, bool free_head, DPDFObjectHandle const& trailer)
{
    dpdf_offset_t xref_offset = p.getCount();
    offsets.emplace_back(objid, xref_offset);
    std::sort(offsets.begin(), offsets.end());
    auto all = rows(offsets, free_head);
    int const w2 = field_width(xref_offset);

    std::string data;
    auto index = DPDFObjectHandle::newArray();
    for_each_subsection(all, [&](size_t first, size_t count) {
        index.appendItem(DPDFObjectHandle::newInteger(all[first].first));
        index.appendItem(DPDFObjectHandle::newInteger(DIntC::to_longlong(count)));
        for (size_t i = first; i < first + count; ++i) {
            bool in_use = all[i].second != free_head_row;
            dpdf_offset_t field2 = in_use ? all[i].second : 0;
            int generation = in_use ? 0 : 0xffff;
            data += static_cast<char>(in_use ? 1 : 0);
            for (int b = w2 - 1; b >= 0; --b) {
                data += static_cast<char>((field2 >> (8 * b)) & 0xff);
            }
            data += static_cast<char>((generation >> 8) & 0xff);
            data += static_cast<char>(generation & 0xff);
        }
    });

    auto flate = DPDFObjectHandle::newName("/FlateDecode");
    auto dict = DPDFObjectHandle::newDictionary();
    dict.replaceKey("/Type", DPDFObjectHandle::newName("/XRef"));
    dict.replaceKey("/Size", DPDFObjectHandle::newInteger(all.back().first + 1));
    dict.replaceKey(
        "/W",
        DPDFObjectHandle::newArray(
            {DPDFObjectHandle::newInteger(1),
             DPDFObjectHandle::newInteger(w2),
             DPDFObjectHandle::newInteger(2)}));
    dict.replaceKey("/Index", index);
    dict.replaceKey("/Filter", flate);
    for (auto const& [key, value]: trailer.getDictItems()) {
        if (key != "/Size") {
            dict.replaceKey(key, value);
        }
    }
    auto stream = DPDFObjectHandle::newStream(
        dict, DPDFStreamFilter::encode(data, flate, "cross-reference stream"));
    p << std::to_string(objid) << " 0 obj\n" << stream.unparseResolved() << "\nendobj\n";
    return xref_offset;
}

std::string
writer::md5_digest(std::string const& data)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("unable to allocate OpenSSL digest context");
    }
    unsigned char md_out[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    check_openssl(EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr));
    check_openssl(EVP_DigestUpdate(ctx.get(), data.data(), data.size()));
    check_openssl(EVP_DigestFinal_ex(ctx.get(), md_out, &md_len));
    return {reinterpret_cast<char*>(md_out), md_len};
}
