#include <deltapdf/DPDFStreamFilter.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/Pl_String.hh>
#include <deltapdf/SF_ASCII85Decode.hh>
#include <deltapdf/SF_ASCIIHexDecode.hh>
#include <deltapdf/SF_FlateLzwDecode.hh>
#include <deltapdf/SF_RunLengthDecode.hh>

#include <vector>

namespace
{
    class FilterChain
    {
      public:
        FilterChain(std::string const& description) :
            description(description)
        {
        }

        DPDFExc
        error(dpdf_error_code_e code, std::string const& msg) const
        {
            return {code, description, "", 0, msg};
        }

        // Read /Filter and create a filter object for each name.
        void
        load(DPDFObjectHandle const& filter_obj)
        {
            checkDirect(filter_obj);
            if (!filter_obj.isInitialized() || filter_obj.isNull()) {
                return;
            }
            if (filter_obj.isName()) {
                add(filter_obj);
                return;
            }
            if (!filter_obj.isArray()) {
                throw error(dpdf_e_invalid_object, "stream filter type is not name or array");
            }
            for (auto const& item: filter_obj.getArrayAsVector()) {
                checkDirect(item);
                add(item);
            }
        }

        // Pipeline errors mean the data is damaged.
        void
        run(Pipeline* head, std::string const& data)
        {
            try {
                head->writeString(data);
                head->finish();
            } catch (DPDFExc&) {
                throw;
            } catch (std::runtime_error& e) {
                throw error(
                    dpdf_e_corrupted, std::string("error filtering stream data: ") + e.what());
            }
        }

        static void
        checkDirect(DPDFObjectHandle const& oh)
        {
            if (oh.isReference()) {
                throw std::logic_error("DPDFStreamFilter called with indirect filter parameters");
            }
        }

        std::string const& description;
        std::vector<std::string> names;
        std::vector<std::shared_ptr<DPDFStreamFilter>> filters;

      private:
        void
        add(DPDFObjectHandle const& name)
        {
            if (!name.isName()) {
                throw error(dpdf_e_invalid_object, "stream filter type is not name or array");
            }
            auto filter = DPDFStreamFilter::create(name.getName());
            if (!filter) {
                throw error(dpdf_e_unsupported, "unsupported stream filter " + name.getName());
            }
            names.emplace_back(name.getName());
            filters.emplace_back(filter);
        }
    };
} // namespace

bool
DPDFStreamFilter::setDecodeParms(DPDFObjectHandle decode_parms)
{
    return decode_parms.isNull() ||
        (decode_parms.isDictionary() && decode_parms.getDictItems().empty());
}

Pipeline*
DPDFStreamFilter::getEncodePipeline(Pipeline*)
{
    return nullptr;
}

std::shared_ptr<DPDFStreamFilter>
DPDFStreamFilter::create(std::string const& name)
{
    // The PDF specification provides the abbreviations for use in inline images, but Adobe Reader
    // also accepts them for stream filters.
    if (name == "/FlateDecode" || name == "/Fl") {
        return SF_FlateLzwDecode::flate_factory();
    }
    if (name == "/LZWDecode" || name == "/LZW") {
        return SF_FlateLzwDecode::lzw_factory();
    }
    if (name == "/RunLengthDecode" || name == "/RL") {
        return SF_RunLengthDecode::factory();
    }
    if (name == "/ASCII85Decode" || name == "/A85") {
        return SF_ASCII85Decode::factory();
    }
    if (name == "/ASCIIHexDecode" || name == "/AHx") {
        return SF_ASCIIHexDecode::factory();
    }
    return nullptr;
}

std::string
DPDFStreamFilter::decode(
    std::string const& raw,
    DPDFObjectHandle filter_obj,
    DPDFObjectHandle decode_obj,
    std::string const& description)
{
    FilterChain chain(description);
    chain.load(filter_obj);
    auto& filters = chain.filters;
    if (filters.empty()) {
        return raw;
    }

    // /DecodeParms is either one entry per filter or a single value used for all of them.
    std::vector<DPDFObjectHandle> parms;
    FilterChain::checkDirect(decode_obj);
    if (decode_obj.isArray() && decode_obj.getArrayNItems() > 0) {
        if (DIntC::to_size(decode_obj.getArrayNItems()) != filters.size()) {
            throw chain.error(
                dpdf_e_invalid_object, "stream /DecodeParms length is inconsistent with filters");
        }
        for (auto const& item: decode_obj.getArrayAsVector()) {
            FilterChain::checkDirect(item);
            parms.emplace_back(item);
        }
    } else {
        if (decode_obj.isArray() || !decode_obj.isInitialized()) {
            decode_obj = DPDFObjectHandle::newNull();
        }
        parms.assign(filters.size(), decode_obj);
    }
    for (size_t i = 0; i < filters.size(); ++i) {
        if (!filters.at(i)->setDecodeParms(parms.at(i))) {
            throw chain.error(
                dpdf_e_unsupported,
                "unsupported decode parameters for filter " + chain.names.at(i));
        }
    }

    // The first filter sees the raw data, so it goes at the head of the chain.
    std::string result;
    Pl_String collector("stream data", nullptr, result);
    Pipeline* head = &collector;
    for (auto iter = filters.rbegin(); iter != filters.rend(); ++iter) {
        head = (*iter)->getDecodePipeline(head);
    }
    chain.run(head, raw);
    return result;
}

std::string
DPDFStreamFilter::encode(
    std::string const& data, DPDFObjectHandle filter_obj, std::string const& description)
{
    FilterChain chain(description);
    chain.load(filter_obj);
    if (chain.filters.empty()) {
        return data;
    }

    // Decoding undoes the first filter first, so encoding applies the last filter first and the
    // first filter produces the final bytes.
    std::string result;
    Pl_String collector("stream data", nullptr, result);
    Pipeline* head = &collector;
    for (size_t i = 0; i < chain.filters.size(); ++i) {
        head = chain.filters.at(i)->getEncodePipeline(head);
        if (head == nullptr) {
            throw chain.error(
                dpdf_e_unsupported, "can't encode data with filter " + chain.names.at(i));
        }
    }
    chain.run(head, data);
    return result;
}
