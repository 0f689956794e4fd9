/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <sred/utilities/log.hpp>
#include <sred/utilities/parsers.hpp>
#include <sred/utilities/xmlutils.hpp>

#include <boost/property_tree/xml_parser.hpp>
#include <ql/errors.hpp>

#include <fstream>
#include <iomanip>
#include <sstream>

using boost::property_tree::ptree;
using QuantLib::Real;
using std::string;
using std::vector;

namespace sre {
namespace data {

namespace {

// property tree keeps attributes and comments as pseudo children
bool isElement(const XMLNode& n) { return n.first != "<xmlattr>" && n.first != "<xmlcomment>"; }

const auto writerSettings = boost::property_tree::xml_writer_make_settings<string>(' ', 2);

} // namespace

XMLDocument::XMLDocument() {}

XMLDocument::XMLDocument(const string& filename) {
    std::ifstream is(filename.c_str());
    QL_REQUIRE(is.is_open(), "Failed to open file " << filename);
    try {
        boost::property_tree::read_xml(is, root_, boost::property_tree::xml_parser::trim_whitespace);
    } catch (const boost::property_tree::xml_parser_error& e) {
        QL_FAIL("Error parsing XML file " << filename << ": " << e.what());
    }
    DLOG("XML document loaded from " << filename);
}

void XMLDocument::fromXMLString(const string& xmlString) {
    std::istringstream is(xmlString);
    ptree root;
    try {
        boost::property_tree::read_xml(is, root, boost::property_tree::xml_parser::trim_whitespace);
    } catch (const boost::property_tree::xml_parser_error& e) {
        QL_FAIL("Error parsing XML string: " << e.what());
    }
    root_.swap(root);
}

XMLNode* XMLDocument::getFirstNode(const string& name) {
    for (auto& n : root_) {
        if (isElement(n) && (name.empty() || n.first == name))
            return &n;
    }
    return nullptr;
}

void XMLDocument::appendNode(XMLNode* node) {
    QL_REQUIRE(node, "XMLDocument::appendNode(): node is null");
    root_.push_back(*node);
}

void XMLDocument::toFile(const string& filename) const {
    std::ofstream os(filename.c_str());
    QL_REQUIRE(os.is_open(), "Failed to open file " << filename << " for writing");
    boost::property_tree::write_xml(os, root_, writerSettings);
    os.close();
}

string XMLDocument::toString() const {
    std::ostringstream os;
    boost::property_tree::write_xml(os, root_, writerSettings);
    return os.str();
}

XMLNode* XMLDocument::allocNode(const string& nodeName) { return &*allocated_.push_back(XMLNode(nodeName, ptree())); }

XMLNode* XMLDocument::allocNode(const string& nodeName, const string& nodeValue) {
    return &*allocated_.push_back(XMLNode(nodeName, ptree(nodeValue)));
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    return doc.toString();
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    QL_REQUIRE(node, "XML Node is NULL (expected " << expectedName << ")");
    QL_REQUIRE(node->first == expectedName,
               "XML Node name " << node->first << " does not match expected name " << expectedName);
}

XMLNode* XMLUtils::addChild(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    return &*n->second.push_back(XMLNode(name, ptree()));
}

void XMLUtils::addChild(XMLNode* n, const string& name, const string& value) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    n->second.push_back(XMLNode(name, ptree(value)));
}

void XMLUtils::addChild(XMLNode* n, const string& name, const char* value) { addChild(n, name, string(value)); }

void XMLUtils::addChild(XMLNode* n, const string& name, Real value) {
    std::ostringstream oss;
    oss << std::setprecision(16) << value;
    addChild(n, name, oss.str());
}

void XMLUtils::addChild(XMLNode* n, const string& name, int value) { addChild(n, name, std::to_string(value)); }

void XMLUtils::addChild(XMLNode* n, const string& name, bool value) {
    addChild(n, name, string(value ? "true" : "false"));
}

void XMLUtils::appendNode(XMLNode* parent, XMLNode* child) {
    QL_REQUIRE(parent, "XMLUtils::appendNode(): parent is null");
    QL_REQUIRE(child, "XMLUtils::appendNode(): child is null");
    parent->second.push_back(*child);
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    XMLNode* child = getChildNode(node, name);
    if (child == nullptr) {
        QL_REQUIRE(!mandatory, "Error: mandatory node " << name << " not found in " << getNodeName(node));
        return defaultValue;
    }
    return getNodeValue(child);
}

Real XMLUtils::getChildValueAsDouble(XMLNode* node, const string& name, bool mandatory, Real defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseReal(s);
}

int XMLUtils::getChildValueAsInt(XMLNode* node, const string& name, bool mandatory, int defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseInteger(s);
}

bool XMLUtils::getChildValueAsBool(XMLNode* node, const string& name, bool mandatory, bool defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseBool(s);
}

XMLNode* XMLUtils::getChildNode(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getChildNode(" << name << "): XML Node is NULL");
    for (auto& c : n->second) {
        if (isElement(c) && (name.empty() || c.first == name))
            return &c;
    }
    return nullptr;
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << "): XML Node is NULL");
    vector<XMLNode*> res;
    for (auto& c : node->second) {
        if (isElement(c) && (name.empty() || c.first == name))
            res.push_back(&c);
    }
    return res;
}

string XMLUtils::getNodeName(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeName(): XML Node is NULL");
    return node->first;
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    return node->second.data();
}

} // namespace data
} // namespace sre
