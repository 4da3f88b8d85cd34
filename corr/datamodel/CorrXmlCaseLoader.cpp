/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrXmlCaseLoader.h"
#include "CorrBlackboard.h"
#include "corr/utilities/CorrException.h"
#include "corr/services/CorrServices.h"

#include <fstream>
#include <sstream>
#include <vector>

// Poco includes
#include "Poco/AutoPtr.h"
#include "Poco/File.h"
#include "Poco/NumberParser.h"
#include "Poco/String.h"
#include "Poco/StringTokenizer.h"
#include "Poco/DOM/DOMParser.h"
#include "Poco/DOM/Document.h"
#include "Poco/DOM/Element.h"
#include "Poco/DOM/NodeList.h"
#include "Poco/SAX/InputSource.h"
#include "Poco/SAX/SAXException.h"

using namespace std;

const string CorrXmlCaseLoader::CASE_ELEMENT = "CORR_CASE";
const string CorrXmlCaseLoader::DATA_SOURCE_ELEMENT = "DATA_SOURCE";
const string CorrXmlCaseLoader::FILE_ELEMENT = "FILE";
const string CorrXmlCaseLoader::ARTIFACT_ELEMENT = "ARTIFACT";
const string CorrXmlCaseLoader::ATTRIBUTE_ELEMENT = "ATTRIBUTE";

namespace
{
    const std::string MSG_PREFIX = "CorrXmlCaseLoader : ";
    const std::string MODULE_NAME = "CorrXmlCaseLoader";

    void fail(const std::string &element, const std::string &problem)
    {
        std::ostringstream msg;
        msg << MSG_PREFIX << element << " element " << problem;
        throw CorrCaseFileException(msg.str());
    }

    std::string attribute(const Poco::XML::Element *elem, const std::string &name, bool required)
    {
        if (!elem->hasAttribute(name)) {
            if (required)
                fail(Poco::XML::fromXMLString(elem->nodeName()), "is missing the " + name + " attribute");
            return "";
        }
        return Poco::XML::fromXMLString(elem->getAttribute(name));
    }

    uint64_t idAttribute(const Poco::XML::Element *elem, const std::string &name)
    {
        std::string value = Poco::trim(attribute(elem, name, true));
        Poco::UInt64 id = 0;
        if (!Poco::NumberParser::tryParseUnsigned64(value, id))
            fail(Poco::XML::fromXMLString(elem->nodeName()), "has invalid " + name + " attribute: " + value);
        return id;
    }

    int parseFileType(const std::string &name)
    {
        static const char * const names[] = {
            "FS", "CARVED", "DERIVED", "LOCAL", "UNALLOC_BLOCKS", "UNUSED_BLOCKS",
            "VIRTUAL_DIR", "SLACK", "LOCAL_DIR", "LAYOUT_FILE"
        };
        for (int i = 0; i < static_cast<int>(sizeof(names) / sizeof(names[0])); ++i) {
            if (Poco::icompare(name, names[i]) == 0)
                return CORR_FILE_TYPE_FS + i;
        }
        fail(CorrXmlCaseLoader::FILE_ELEMENT, "has unrecognized type: " + name);
        return 0;
    }

    int parseMetaFlags(const std::string &value)
    {
        int flags = 0;
        Poco::StringTokenizer tokens(value, "|", Poco::StringTokenizer::TOK_TRIM | Poco::StringTokenizer::TOK_IGNORE_EMPTY);
        for (Poco::StringTokenizer::Iterator it = tokens.begin(); it != tokens.end(); ++it) {
            if (Poco::icompare(*it, "ALLOC") == 0)
                flags |= CORR_META_FLAG_ALLOC;
            else if (Poco::icompare(*it, "UNALLOC") == 0)
                flags |= CORR_META_FLAG_UNALLOC;
            else if (Poco::icompare(*it, "USED") == 0)
                flags |= CORR_META_FLAG_USED;
            else if (Poco::icompare(*it, "UNUSED") == 0)
                flags |= CORR_META_FLAG_UNUSED;
            else if (Poco::icompare(*it, "COMP") == 0)
                flags |= CORR_META_FLAG_COMP;
            else if (Poco::icompare(*it, "ORPHAN") == 0)
                flags |= CORR_META_FLAG_ORPHAN;
            else
                fail(CorrXmlCaseLoader::FILE_ELEMENT, "has unrecognized meta flag: " + *it);
        }
        return flags;
    }

    std::vector<unsigned char> parseHexBytes(const std::string &hex)
    {
        std::vector<unsigned char> bytes;
        if (hex.size() % 2 != 0)
            fail(CorrXmlCaseLoader::ATTRIBUTE_ELEMENT, "has odd length byte value: " + hex);
        for (std::string::size_type i = 0; i < hex.size(); i += 2) {
            unsigned int byte = 0;
            if (!Poco::NumberParser::tryParseHex(hex.substr(i, 2), byte))
                fail(CorrXmlCaseLoader::ATTRIBUTE_ELEMENT, "has invalid byte value: " + hex);
            bytes.push_back(static_cast<unsigned char>(byte));
        }
        return bytes;
    }

    CorrBlackboardAttribute parseAttribute(const Poco::XML::Element *elem)
    {
        int typeId = 0;
        std::string typeName = attribute(elem, "type", true);
        try {
            typeId = CorrBlackboard::attrTypeNameToTypeID(typeName);
        }
        catch (CorrNotFoundException &) {
            fail(CorrXmlCaseLoader::ATTRIBUTE_ELEMENT, "has unrecognized type: " + typeName);
        }

        std::string module = attribute(elem, "module", false);
        if (module.empty())
            module = MODULE_NAME;

        std::string valueType = Poco::toUpper(Poco::trim(attribute(elem, "value_type", false)));
        std::string text = Poco::XML::fromXMLString(elem->innerText());

        if (valueType.empty() || valueType == "STRING")
            return CorrBlackboardAttribute(typeId, module, text);
        if (valueType == "JSON")
            return CorrBlackboardAttribute::json(typeId, module, text);
        if (valueType == "BYTE")
            return CorrBlackboardAttribute(typeId, module, parseHexBytes(Poco::trim(text)));

        std::string number = Poco::trim(text);
        if (valueType == "INTEGER") {
            int value = 0;
            if (Poco::NumberParser::tryParse(number, value))
                return CorrBlackboardAttribute(typeId, module, value);
        }
        else if (valueType == "LONG" || valueType == "DATETIME") {
            Poco::Int64 value = 0;
            if (Poco::NumberParser::tryParse64(number, value)) {
                if (valueType == "LONG")
                    return CorrBlackboardAttribute(typeId, module, static_cast<int64_t>(value));
                return CorrBlackboardAttribute::dateTime(typeId, module, static_cast<int64_t>(value));
            }
        }
        else if (valueType == "DOUBLE") {
            double value = 0;
            if (Poco::NumberParser::tryParseFloat(number, value))
                return CorrBlackboardAttribute(typeId, module, value);
        }
        else {
            fail(CorrXmlCaseLoader::ATTRIBUTE_ELEMENT, "has unrecognized value_type: " + valueType);
        }
        fail(CorrXmlCaseLoader::ATTRIBUTE_ELEMENT, "has invalid " + valueType + " value: " + number);
        return CorrBlackboardAttribute(typeId, module, text);
    }

    CorrBlackboardArtifact parseArtifact(const Poco::XML::Element *elem)
    {
        uint64_t id = idAttribute(elem, "id");
        uint64_t objId = idAttribute(elem, "obj_id");
        std::string typeName = attribute(elem, "type", true);
        int typeId = 0;
        try {
            typeId = CorrBlackboard::artTypeNameToTypeID(typeName);
        }
        catch (CorrNotFoundException &) {
            fail(CorrXmlCaseLoader::ARTIFACT_ELEMENT, "has unrecognized type: " + typeName);
        }

        CorrBlackboardArtifact artifact(id, objId, typeId);
        Poco::AutoPtr<Poco::XML::NodeList> children = elem->childNodes();
        for (unsigned long i = 0; i < children->length(); ++i) {
            Poco::XML::Node *child = children->item(i);
            if (child->nodeType() != Poco::XML::Node::ELEMENT_NODE)
                continue;
            if (Poco::XML::fromXMLString(child->nodeName()) != CorrXmlCaseLoader::ATTRIBUTE_ELEMENT)
                fail(CorrXmlCaseLoader::ARTIFACT_ELEMENT, "has unexpected child: " + Poco::XML::fromXMLString(child->nodeName()));
            artifact.addAttribute(parseAttribute(static_cast<Poco::XML::Element *>(child)));
        }
        return artifact;
    }

    void load(const Poco::XML::Document *doc, CorrMemoryCaseDb &caseDb)
    {
        Poco::XML::Element *root = doc->documentElement();
        if (root == NULL || Poco::XML::fromXMLString(root->nodeName()) != CorrXmlCaseLoader::CASE_ELEMENT) {
            std::ostringstream msg;
            msg << MSG_PREFIX << "root element must be " << CorrXmlCaseLoader::CASE_ELEMENT;
            throw CorrCaseFileException(msg.str());
        }

        std::string uuid = Poco::trim(attribute(root, "uuid", true));
        if (uuid.empty())
            fail(CorrXmlCaseLoader::CASE_ELEMENT, "has empty uuid attribute");
        std::string name = attribute(root, "name", false);

        // caseDb is only touched once the whole document has been read
        CorrMemoryCaseDb loaded;

        Poco::AutoPtr<Poco::XML::NodeList> children = root->childNodes();
        for (unsigned long i = 0; i < children->length(); ++i) {
            Poco::XML::Node *child = children->item(i);
            if (child->nodeType() != Poco::XML::Node::ELEMENT_NODE)
                continue;
            const Poco::XML::Element *elem = static_cast<Poco::XML::Element *>(child);
            const std::string nodeName = Poco::XML::fromXMLString(elem->nodeName());

            if (nodeName == CorrXmlCaseLoader::DATA_SOURCE_ELEMENT) {
                CorrDataSourceInfo dataSource;
                dataSource.objectId = idAttribute(elem, "id");
                dataSource.deviceId = attribute(elem, "device_id", false);
                dataSource.name = attribute(elem, "name", false);
                loaded.addDataSource(dataSource);
            }
            else if (nodeName == CorrXmlCaseLoader::FILE_ELEMENT) {
                loaded.addFile(CorrFile(idAttribute(elem, "id"),
                                        attribute(elem, "name", true),
                                        attribute(elem, "parent_path", false),
                                        parseFileType(Poco::trim(attribute(elem, "type", true))),
                                        parseMetaFlags(attribute(elem, "meta_flags", false)),
                                        Poco::trim(attribute(elem, "md5", false)),
                                        idAttribute(elem, "data_source")));
            }
            else if (nodeName == CorrXmlCaseLoader::ARTIFACT_ELEMENT) {
                loaded.addArtifact(parseArtifact(elem));
            }
            else {
                fail(CorrXmlCaseLoader::CASE_ELEMENT, "has unexpected child: " + nodeName);
            }
        }

        loaded.openCase(uuid, name);
        caseDb = loaded;

        std::ostringstream msg;
        msg << MSG_PREFIX << "loaded case " << uuid << " with "
            << caseDb.getFiles().size() << " files and "
            << caseDb.getArtifacts().size() << " artifacts";
        LOGINFO(msg.str());
    }
}

void CorrXmlCaseLoader::loadString(const std::string &xml, CorrMemoryCaseDb &caseDb)
{
    try {
        Poco::XML::DOMParser parser;
        Poco::AutoPtr<Poco::XML::Document> doc = parser.parseString(xml);
        load(doc, caseDb);
    }
    catch (CorrCaseFileException &) {
        throw;
    }
    catch (Poco::XML::SAXParseException &ex) {
        std::ostringstream msg;
        msg << MSG_PREFIX << "case description could not be parsed: " << ex.displayText();
        throw CorrCaseFileException(msg.str());
    }
    catch (Poco::Exception &ex) {
        std::ostringstream msg;
        msg << MSG_PREFIX << "Poco::Exception: " << ex.displayText();
        throw CorrCaseFileException(msg.str());
    }
}

void CorrXmlCaseLoader::loadFile(const std::string &path, CorrMemoryCaseDb &caseDb)
{
    try {
        Poco::File caseFile(path);
        if (!caseFile.exists()) {
            std::ostringstream msg;
            msg << MSG_PREFIX << "case file '" << path << "' does not exist";
            throw CorrCaseFileException(msg.str());
        }

        std::ifstream caseStream(caseFile.path().c_str());
        if (!caseStream) {
            std::ostringstream msg;
            msg << MSG_PREFIX << "failed to open case file '" << path << "'";
            throw CorrCaseFileException(msg.str());
        }

        Poco::XML::InputSource inputSource(caseStream);
        Poco::AutoPtr<Poco::XML::Document> doc = Poco::XML::DOMParser().parse(&inputSource);
        load(doc, caseDb);
    }
    catch (CorrCaseFileException &) {
        throw;
    }
    catch (Poco::XML::SAXParseException &ex) {
        std::ostringstream msg;
        msg << MSG_PREFIX << "case file '" << path << "' could not be parsed: " << ex.displayText();
        throw CorrCaseFileException(msg.str());
    }
    catch (Poco::Exception &ex) {
        std::ostringstream msg;
        msg << MSG_PREFIX << "Poco::Exception: " << ex.displayText();
        throw CorrCaseFileException(msg.str());
    }
}
