// Copyright (c) 2024-2026 The deltapdf authors
//
// This file is part of deltapdf.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef DPDFOBJECTHANDLE_HH
#define DPDFOBJECTHANDLE_HH

#include <deltapdf/Constants.h>
#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <deltapdf/DPDFObjGen.hh>

#include <memory>
#include <string>
#include <utility>
#include <vector>

class DPDF;
class DPDFObject;
class DPDFParser;

// DPDFObjectHandle is a smart pointer to a PDF object. Copying a handle produces another handle to
// the same object, so changes made through one handle are visible through the other. Use
// shallowCopy to get an independent object.
//
// A handle obtained from a DPDF remembers the object number and generation it was read from. An
// indirect reference inside a container is kept as a reference object (isReference() returns
// true); pass it to DPDF::resolve to follow it.
//
// Accessors that are called on an object of the wrong type throw std::logic_error.
class DELTAPDF_DLL_CLASS DPDFObjectHandle
{
  public:
    // Dictionary items in insertion order
    typedef std::vector<std::pair<std::string, DPDFObjectHandle>> dict_items_t;

    DELTAPDF_DLL
    DPDFObjectHandle() = default;
    DELTAPDF_DLL
    DPDFObjectHandle(DPDFObjectHandle const&) = default;
    DELTAPDF_DLL
    DPDFObjectHandle& operator=(DPDFObjectHandle const&) = default;
    DELTAPDF_DLL
    DPDFObjectHandle(DPDFObjectHandle&&) = default;
    DELTAPDF_DLL
    DPDFObjectHandle& operator=(DPDFObjectHandle&&) = default;

    // Parse a single PDF object from a string. Indirect references are kept as reference objects.
    // A stream may be parsed only if its /Length is direct. Errors are reported by throwing
    // DPDFExc with object_description used as the object name.
    DELTAPDF_DLL
    static DPDFObjectHandle
    parse(std::string const& object_str, std::string const& object_description = "");

    // Factories
    DELTAPDF_DLL
    static DPDFObjectHandle newNull();
    DELTAPDF_DLL
    static DPDFObjectHandle newBool(bool value);
    DELTAPDF_DLL
    static DPDFObjectHandle newInteger(long long value);
    // The string must be a valid PDF real; it is written back exactly as given.
    DELTAPDF_DLL
    static DPDFObjectHandle newReal(std::string const& value);
    DELTAPDF_DLL
    static DPDFObjectHandle newReal(double value, int decimal_places = 0);
    // Names are given in decoded form with a leading "/".
    DELTAPDF_DLL
    static DPDFObjectHandle newName(std::string const& name);
    DELTAPDF_DLL
    static DPDFObjectHandle newString(std::string const& str);
    DELTAPDF_DLL
    static DPDFObjectHandle newHexString(std::string const& str);
    DELTAPDF_DLL
    static DPDFObjectHandle newArray();
    DELTAPDF_DLL
    static DPDFObjectHandle newArray(std::vector<DPDFObjectHandle> const& items);
    DELTAPDF_DLL
    static DPDFObjectHandle newDictionary();
    DELTAPDF_DLL
    static DPDFObjectHandle newDictionary(dict_items_t const& items);
    DELTAPDF_DLL
    static DPDFObjectHandle newReference(DPDFObjGen og);
    DELTAPDF_DLL
    static DPDFObjectHandle newReference(int objid, int generation);
    // Create a stream with the given dictionary and raw (still encoded) data. /Length in the
    // dictionary is set to the size of the data.
    DELTAPDF_DLL
    static DPDFObjectHandle newStream(DPDFObjectHandle stream_dict, std::string const& data);

    // Type tests
    DELTAPDF_DLL
    bool isInitialized() const;
    DELTAPDF_DLL
    dpdf_object_type_e getTypeCode() const;
    DELTAPDF_DLL
    char const* getTypeName() const;
    DELTAPDF_DLL
    bool isNull() const;
    DELTAPDF_DLL
    bool isBool() const;
    DELTAPDF_DLL
    bool isInteger() const;
    DELTAPDF_DLL
    bool isReal() const;
    // True for integers and reals
    DELTAPDF_DLL
    bool isNumber() const;
    DELTAPDF_DLL
    bool isString() const;
    DELTAPDF_DLL
    bool isName() const;
    DELTAPDF_DLL
    bool isArray() const;
    DELTAPDF_DLL
    bool isDictionary() const;
    DELTAPDF_DLL
    bool isStream() const;
    DELTAPDF_DLL
    bool isReference() const;
    DELTAPDF_DLL
    bool isNameAndEquals(std::string const& name) const;
    DELTAPDF_DLL
    bool isDictionaryOfType(std::string const& type) const;

    // True if this object was read as an indirect object. Reference objects are not indirect.
    DELTAPDF_DLL
    bool isIndirect() const;
    DELTAPDF_DLL
    DPDFObjGen getObjGen() const;
    // For a reference, the object number and generation it refers to
    DELTAPDF_DLL
    DPDFObjGen getRefObjGen() const;

    // Scalar accessors
    DELTAPDF_DLL
    bool getBoolValue() const;
    DELTAPDF_DLL
    long long getIntValue() const;
    // Throws std::range_error if the value does not fit in an int
    DELTAPDF_DLL
    int getIntValueAsInt() const;
    DELTAPDF_DLL
    std::string getRealValue() const;
    // Integer or real as a double
    DELTAPDF_DLL
    double getNumericValue() const;
    DELTAPDF_DLL
    std::string getStringValue() const;
    DELTAPDF_DLL
    bool isHexString() const;
    DELTAPDF_DLL
    std::string getName() const;

    // Handles share the object they point to. The modifiers below change it for every handle,
    // including the ones a DPDF returns for the same object number, so edit a shallowCopy() of an
    // object read from a document unless the change is meant for the document.

    // Arrays. getArrayItem returns null for an index out of range.
    DELTAPDF_DLL
    int getArrayNItems() const;
    DELTAPDF_DLL
    DPDFObjectHandle getArrayItem(int n) const;
    DELTAPDF_DLL
    std::vector<DPDFObjectHandle> getArrayAsVector() const;
    DELTAPDF_DLL
    void setArrayItem(int n, DPDFObjectHandle const& item);
    DELTAPDF_DLL
    void appendItem(DPDFObjectHandle const& item);
    DELTAPDF_DLL
    void eraseItem(int at);

    // Dictionaries. getKey returns null if the key is absent. Replacing an existing key keeps its
    // position; a new key is added at the end.
    DELTAPDF_DLL
    bool hasKey(std::string const& key) const;
    DELTAPDF_DLL
    DPDFObjectHandle getKey(std::string const& key) const;
    DELTAPDF_DLL
    std::vector<std::string> getKeys() const;
    DELTAPDF_DLL
    dict_items_t const& getDictItems() const;
    DELTAPDF_DLL
    void replaceKey(std::string const& key, DPDFObjectHandle const& value);
    DELTAPDF_DLL
    void removeKey(std::string const& key);

    // Streams
    DELTAPDF_DLL
    DPDFObjectHandle getDict() const;
    DELTAPDF_DLL
    std::string const& getRawStreamData() const;
    // Decode the stream data using /Filter and /DecodeParms from the stream dictionary. The result
    // is cached on the stream. If the filter or its parameters contain indirect references, this
    // throws std::logic_error; use DPDF::getStreamData instead, which resolves them.
    DELTAPDF_DLL
    std::string getStreamData() const;
    // Replace the raw data of a stream. /Length is updated and the decoded cache is cleared.
    DELTAPDF_DLL
    void replaceStreamData(std::string const& data);

    // Return a direct copy of this object. Containers are copied one level deep: the items of a
    // copied array or dictionary are shared with the original.
    DELTAPDF_DLL
    DPDFObjectHandle shallowCopy() const;

    // Serialize as PDF syntax. unparse() writes "n g R" for an indirect object; unparseResolved
    // always writes the object's own value. Items of containers that are indirect objects are
    // written as references. Strings keep their literal or hexadecimal form. A stream is written
    // with its dictionary, the stream keyword, its raw data and endstream, with /Length set to the
    // size of the data.
    DELTAPDF_DLL
    std::string unparse() const;
    DELTAPDF_DLL
    std::string unparseResolved() const;

  private:
    friend class DPDF;
    friend class DPDFParser;

    DPDFObjectHandle(std::shared_ptr<DPDFObject> const& obj) :
        obj(obj)
    {
    }
    void setObjGen(DPDFObjGen og);
    void cacheStreamData(std::string const& data) const;
    DPDFObject& checked(dpdf_object_type_e type, char const* method) const;

    std::shared_ptr<DPDFObject> obj;
};

#endif // DPDFOBJECTHANDLE_HH
