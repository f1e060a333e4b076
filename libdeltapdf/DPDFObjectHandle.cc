#include <deltapdf/DPDFObjectHandle.hh>

#include <deltapdf/BufferInputSource.hh>
#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObject_private.hh>
#include <deltapdf/DPDFParser.hh>
#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/DPDFTokenizer.hh>
#include <deltapdf/DUtil.hh>

#include <cstdlib>
#include <stdexcept>

namespace
{
    char const* const type_names[] = {
        "uninitialized",
        "null",
        "boolean",
        "integer",
        "real",
        "string",
        "name",
        "array",
        "dictionary",
        "reference",
        "stream",
    };

    void
    insert_or_replace(
        DPDFObjectHandle::dict_items_t& items,
        std::string const& key,
        DPDFObjectHandle const& value)
    {
        for (auto& item: items) {
            if (item.first == key) {
                item.second = value;
                return;
            }
        }
        items.emplace_back(key, value);
    }
} // namespace

DPDFObjectHandle
DPDFObjectHandle::parse(std::string const& object_str, std::string const& object_description)
{
    BufferInputSource input("parsed object", object_str);
    auto result = DPDFParser(input, object_description, nullptr).parse();
    auto token = DPDFTokenizer().readToken(input, object_description, true);
    if (token.getType() != DPDFTokenizer::tt_eof) {
        throw DPDFExc(
            dpdf_e_unexpected_token,
            input.getName(),
            object_description,
            token.getOffset(),
            "trailing data found parsing object from string");
    }
    return result;
}

DPDFObjectHandle
DPDFObjectHandle::newNull()
{
    return {DPDFObject::create<DPDF_Null>()};
}

DPDFObjectHandle
DPDFObjectHandle::newBool(bool value)
{
    return {DPDFObject::create<DPDF_Bool>(value)};
}

DPDFObjectHandle
DPDFObjectHandle::newInteger(long long value)
{
    return {DPDFObject::create<DPDF_Integer>(value)};
}

DPDFObjectHandle
DPDFObjectHandle::newReal(std::string const& value)
{
    return {DPDFObject::create<DPDF_Real>(value)};
}

DPDFObjectHandle
DPDFObjectHandle::newReal(double value, int decimal_places)
{
    return {DPDFObject::create<DPDF_Real>(DUtil::double_to_string(value, decimal_places))};
}

DPDFObjectHandle
DPDFObjectHandle::newName(std::string const& name)
{
    return {DPDFObject::create<DPDF_Name>(name)};
}

DPDFObjectHandle
DPDFObjectHandle::newString(std::string const& str)
{
    return {DPDFObject::create<DPDF_String>(str, false)};
}

DPDFObjectHandle
DPDFObjectHandle::newHexString(std::string const& str)
{
    return {DPDFObject::create<DPDF_String>(str, true)};
}

DPDFObjectHandle
DPDFObjectHandle::newArray()
{
    return newArray(std::vector<DPDFObjectHandle>());
}

DPDFObjectHandle
DPDFObjectHandle::newArray(std::vector<DPDFObjectHandle> const& items)
{
    return {DPDFObject::create<DPDF_Array>(items)};
}

DPDFObjectHandle
DPDFObjectHandle::newDictionary()
{
    return newDictionary(dict_items_t());
}

DPDFObjectHandle
DPDFObjectHandle::newDictionary(dict_items_t const& items)
{
    dict_items_t unique;
    for (auto const& [key, value]: items) {
        insert_or_replace(unique, key, value);
    }
    return {DPDFObject::create<DPDF_Dictionary>(std::move(unique))};
}

DPDFObjectHandle
DPDFObjectHandle::newReference(DPDFObjGen og)
{
    if (!og.isIndirect()) {
        throw std::logic_error("DPDFObjectHandle::newReference called with object number 0");
    }
    return {DPDFObject::create<DPDF_Reference>(og)};
}

DPDFObjectHandle
DPDFObjectHandle::newReference(int objid, int generation)
{
    return newReference(DPDFObjGen(objid, generation));
}

DPDFObjectHandle
DPDFObjectHandle::newStream(DPDFObjectHandle stream_dict, std::string const& data)
{
    if (!stream_dict.isDictionary()) {
        throw std::logic_error("DPDFObjectHandle::newStream called with a non-dictionary");
    }
    stream_dict.replaceKey("/Length", newInteger(DIntC::to_longlong(data.size())));
    return {DPDFObject::create<DPDF_Stream>(stream_dict, data)};
}

bool
DPDFObjectHandle::isInitialized() const
{
    return obj != nullptr;
}

dpdf_object_type_e
DPDFObjectHandle::getTypeCode() const
{
    return obj ? obj->getTypeCode() : dpdf_ot_uninitialized;
}

char const*
DPDFObjectHandle::getTypeName() const
{
    return type_names[getTypeCode()];
}

bool
DPDFObjectHandle::isNull() const
{
    return getTypeCode() == dpdf_ot_null;
}

bool
DPDFObjectHandle::isBool() const
{
    return getTypeCode() == dpdf_ot_boolean;
}

bool
DPDFObjectHandle::isInteger() const
{
    return getTypeCode() == dpdf_ot_integer;
}

bool
DPDFObjectHandle::isReal() const
{
    return getTypeCode() == dpdf_ot_real;
}

bool
DPDFObjectHandle::isNumber() const
{
    return isInteger() || isReal();
}

bool
DPDFObjectHandle::isString() const
{
    return getTypeCode() == dpdf_ot_string;
}

bool
DPDFObjectHandle::isName() const
{
    return getTypeCode() == dpdf_ot_name;
}

bool
DPDFObjectHandle::isArray() const
{
    return getTypeCode() == dpdf_ot_array;
}

bool
DPDFObjectHandle::isDictionary() const
{
    return getTypeCode() == dpdf_ot_dictionary;
}

bool
DPDFObjectHandle::isStream() const
{
    return getTypeCode() == dpdf_ot_stream;
}

bool
DPDFObjectHandle::isReference() const
{
    return getTypeCode() == dpdf_ot_reference;
}

bool
DPDFObjectHandle::isNameAndEquals(std::string const& name) const
{
    return isName() && obj->as<DPDF_Name>()->name == name;
}

bool
DPDFObjectHandle::isDictionaryOfType(std::string const& type) const
{
    return isDictionary() && getKey("/Type").isNameAndEquals(type);
}

bool
DPDFObjectHandle::isIndirect() const
{
    return obj && obj->og.isIndirect();
}

DPDFObjGen
DPDFObjectHandle::getObjGen() const
{
    return obj ? obj->og : DPDFObjGen();
}

DPDFObjGen
DPDFObjectHandle::getRefObjGen() const
{
    return checked(dpdf_ot_reference, "getRefObjGen").as<DPDF_Reference>()->og;
}

DPDFObject&
DPDFObjectHandle::checked(dpdf_object_type_e type, char const* method) const
{
    if (getTypeCode() != type) {
        throw std::logic_error(
            std::string("DPDFObjectHandle::") + method + " called on " + getTypeName() +
            " object; expected " + type_names[type]);
    }
    return *obj;
}

bool
DPDFObjectHandle::getBoolValue() const
{
    return checked(dpdf_ot_boolean, "getBoolValue").as<DPDF_Bool>()->val;
}

long long
DPDFObjectHandle::getIntValue() const
{
    return checked(dpdf_ot_integer, "getIntValue").as<DPDF_Integer>()->val;
}

int
DPDFObjectHandle::getIntValueAsInt() const
{
    return DIntC::to_int(getIntValue());
}

std::string
DPDFObjectHandle::getRealValue() const
{
    return checked(dpdf_ot_real, "getRealValue").as<DPDF_Real>()->val;
}

double
DPDFObjectHandle::getNumericValue() const
{
    if (isInteger()) {
        return static_cast<double>(getIntValue());
    }
    if (isReal()) {
        return atof(getRealValue().c_str());
    }
    throw std::logic_error(
        std::string("DPDFObjectHandle::getNumericValue called on ") + getTypeName() + " object");
}

std::string
DPDFObjectHandle::getStringValue() const
{
    return checked(dpdf_ot_string, "getStringValue").as<DPDF_String>()->val;
}

bool
DPDFObjectHandle::isHexString() const
{
    return checked(dpdf_ot_string, "isHexString").as<DPDF_String>()->hex;
}

std::string
DPDFObjectHandle::getName() const
{
    return checked(dpdf_ot_name, "getName").as<DPDF_Name>()->name;
}

int
DPDFObjectHandle::getArrayNItems() const
{
    return DIntC::to_int(checked(dpdf_ot_array, "getArrayNItems").as<DPDF_Array>()->items.size());
}

DPDFObjectHandle
DPDFObjectHandle::getArrayItem(int n) const
{
    auto& items = checked(dpdf_ot_array, "getArrayItem").as<DPDF_Array>()->items;
    if (n < 0 || DIntC::to_size(n) >= items.size()) {
        return newNull();
    }
    return items.at(DIntC::to_size(n));
}

std::vector<DPDFObjectHandle>
DPDFObjectHandle::getArrayAsVector() const
{
    return checked(dpdf_ot_array, "getArrayAsVector").as<DPDF_Array>()->items;
}

void
DPDFObjectHandle::setArrayItem(int n, DPDFObjectHandle const& item)
{
    auto& items = checked(dpdf_ot_array, "setArrayItem").as<DPDF_Array>()->items;
    if (n < 0 || DIntC::to_size(n) >= items.size()) {
        throw std::logic_error("DPDFObjectHandle::setArrayItem: index out of range");
    }
    items.at(DIntC::to_size(n)) = item;
}

void
DPDFObjectHandle::appendItem(DPDFObjectHandle const& item)
{
    checked(dpdf_ot_array, "appendItem").as<DPDF_Array>()->items.emplace_back(item);
}

void
DPDFObjectHandle::eraseItem(int at)
{
    auto& items = checked(dpdf_ot_array, "eraseItem").as<DPDF_Array>()->items;
    if (at < 0 || DIntC::to_size(at) >= items.size()) {
        throw std::logic_error("DPDFObjectHandle::eraseItem: index out of range");
    }
    items.erase(items.begin() + at);
}

bool
DPDFObjectHandle::hasKey(std::string const& key) const
{
    auto dict = checked(dpdf_ot_dictionary, "hasKey").as<DPDF_Dictionary>();
    return dict->find(key) != dict->items.end();
}

DPDFObjectHandle
DPDFObjectHandle::getKey(std::string const& key) const
{
    auto dict = checked(dpdf_ot_dictionary, "getKey").as<DPDF_Dictionary>();
    auto iter = dict->find(key);
    if (iter == dict->items.end()) {
        return newNull();
    }
    return iter->second;
}

std::vector<std::string>
DPDFObjectHandle::getKeys() const
{
    std::vector<std::string> result;
    for (auto const& item: getDictItems()) {
        result.emplace_back(item.first);
    }
    return result;
}

DPDFObjectHandle::dict_items_t const&
DPDFObjectHandle::getDictItems() const
{
    return checked(dpdf_ot_dictionary, "getDictItems").as<DPDF_Dictionary>()->items;
}

void
DPDFObjectHandle::replaceKey(std::string const& key, DPDFObjectHandle const& value)
{
    insert_or_replace(
        checked(dpdf_ot_dictionary, "replaceKey").as<DPDF_Dictionary>()->items, key, value);
}

void
DPDFObjectHandle::removeKey(std::string const& key)
{
    auto dict = checked(dpdf_ot_dictionary, "removeKey").as<DPDF_Dictionary>();
    auto iter = dict->find(key);
    if (iter != dict->items.end()) {
        dict->items.erase(iter);
    }
}

DPDFObjectHandle
DPDFObjectHandle::getDict() const
{
    return checked(dpdf_ot_stream, "getDict").as<DPDF_Stream>()->dict;
}

std::string const&
DPDFObjectHandle::getRawStreamData() const
{
    return checked(dpdf_ot_stream, "getRawStreamData").as<DPDF_Stream>()->data;
}

std::string
DPDFObjectHandle::getStreamData() const
{
    auto stream = checked(dpdf_ot_stream, "getStreamData").as<DPDF_Stream>();
    if (!stream->decoded) {
        auto description = isIndirect() ? "object " + getObjGen().unparse(' ') : "stream";
        stream->decoded = std::make_shared<std::string>(DPDFStreamFilter::decode(
            stream->data,
            stream->dict.getKey("/Filter"),
            stream->dict.getKey("/DecodeParms"),
            description));
    }
    return *stream->decoded;
}

void
DPDFObjectHandle::cacheStreamData(std::string const& data) const
{
    checked(dpdf_ot_stream, "cacheStreamData").as<DPDF_Stream>()->decoded =
        std::make_shared<std::string>(data);
}

void
DPDFObjectHandle::replaceStreamData(std::string const& data)
{
    auto stream = checked(dpdf_ot_stream, "replaceStreamData").as<DPDF_Stream>();
    stream->data = data;
    stream->dict.replaceKey("/Length", newInteger(DIntC::to_longlong(data.size())));
    stream->decoded.reset();
}

void
DPDFObjectHandle::setObjGen(DPDFObjGen og)
{
    if (obj) {
        obj->og = og;
    }
}

DPDFObjectHandle
DPDFObjectHandle::shallowCopy() const
{
    if (!obj) {
        throw std::logic_error("attempted to copy an uninitialized DPDFObjectHandle");
    }
    if (auto stream = obj->as<DPDF_Stream>()) {
        DPDF_Stream copy(stream->dict.shallowCopy(), stream->data);
        copy.decoded = stream->decoded;
        return {std::make_shared<DPDFObject>(std::move(copy))};
    }
    return {std::make_shared<DPDFObject>(DPDFObject::Value(obj->value))};
}

std::string
DPDFObjectHandle::unparse() const
{
    if (isIndirect()) {
        return getObjGen().unparse(' ') + " R";
    }
    return unparseResolved();
}

std::string
DPDFObjectHandle::unparseResolved() const
{
    std::string result;
    switch (getTypeCode()) {
    case dpdf_ot_uninitialized:
        throw std::logic_error("attempted to unparse an uninitialized DPDFObjectHandle");

    case dpdf_ot_null:
        return "null";

    case dpdf_ot_boolean:
        return obj->as<DPDF_Bool>()->val ? "true" : "false";

    case dpdf_ot_integer:
        return std::to_string(obj->as<DPDF_Integer>()->val);

    case dpdf_ot_real:
        return obj->as<DPDF_Real>()->val;

    case dpdf_ot_string:
        return obj->as<DPDF_String>()->unparse();

    case dpdf_ot_name:
        return DPDF_Name::normalizeName(obj->as<DPDF_Name>()->name);

    case dpdf_ot_array:
        result = "[ ";
        for (auto const& item: obj->as<DPDF_Array>()->items) {
            result += item.unparse();
            result += " ";
        }
        result += "]";
        return result;

    case dpdf_ot_dictionary:
        result = "<< ";
        for (auto const& [key, value]: obj->as<DPDF_Dictionary>()->items) {
            result += DPDF_Name::normalizeName(key);
            result += " ";
            result += value.unparse();
            result += " ";
        }
        result += ">>";
        return result;

    case dpdf_ot_reference:
        return obj->as<DPDF_Reference>()->og.unparse(' ') + " R";

    case dpdf_ot_stream:
        {
            auto stream = obj->as<DPDF_Stream>();
            auto dict = stream->dict.shallowCopy();
            dict.replaceKey("/Length", newInteger(DIntC::to_longlong(stream->data.size())));
            result = dict.unparseResolved();
            result += "\nstream\n";
            result += stream->data;
            result += "\nendstream";
            return result;
        }
    }
    throw std::logic_error("DPDFObjectHandle::unparseResolved: unknown object type");
}
