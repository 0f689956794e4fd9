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

/*! \file sred/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <boost/property_tree/ptree.hpp>

#include <string>
#include <vector>

namespace sre {
namespace data {

/*! An XML node is a (name, subtree) entry of a property tree. Pointers to nodes stay valid as long as the owning
    document is alive and the node is not removed.
    \ingroup utilities
*/
typedef boost::property_tree::ptree::value_type XMLNode;

//! Small XML Document wrapper class.
/*!
  \ingroup utilities
*/
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    XMLDocument(const std::string& filename);

    //! load a document from a hard-coded string
    void fromXMLString(const std::string& xmlString);

    //! Return the first top level node with the given name, the first top level node if name is empty.
    XMLNode* getFirstNode(const std::string& name);
    //! Append a top level node, the node is copied into the document
    void appendNode(XMLNode* node);
    //! save the XML Document to the given file.
    void toFile(const std::string& filename) const;
    //! return the XML Document as a string.
    std::string toString() const;

    //! Create a node that is not yet attached to the document tree.
    /*! Children must be added before the node is appended to its parent, since appending copies the node. */
    XMLNode* allocNode(const std::string& nodeName);
    //! Create a detached node with the given value
    XMLNode* allocNode(const std::string& nodeName, const std::string& nodeValue);

private:
    boost::property_tree::ptree root_;
    boost::property_tree::ptree allocated_;
};

//! Base class for all serializable classes
/*!
  \ingroup utilities
*/
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(XMLNode* node) = 0;
    virtual XMLNode* toXML(XMLDocument& doc) const = 0;

    void fromFile(const std::string& filename);
    void toFile(const std::string& filename) const;

    //! Parse from XML string
    void fromXMLString(const std::string& xml);
    //! Parse from XML string
    std::string toXMLString() const;
};

//! XML Utilities Class
/*!
  \ingroup utilities
*/
class XMLUtils {
public:
    //! Checks that the node is not null and has the expected name, throws otherwise
    static void checkNode(XMLNode* n, const std::string& expectedName);

    static XMLNode* addChild(XMLNode* n, const std::string& name);
    static void addChild(XMLNode* n, const std::string& name, const std::string& value);
    static void addChild(XMLNode* n, const std::string& name, const char* value);
    static void addChild(XMLNode* n, const std::string& name, QuantLib::Real value);
    static void addChild(XMLNode* n, const std::string& name, int value);
    static void addChild(XMLNode* n, const std::string& name, bool value);
    //! Appends a copy of the child node to the parent node
    static void appendNode(XMLNode* parent, XMLNode* child);

    //! Get a child node value as a string, the node is searched for among the children of n
    static std::string getChildValue(XMLNode* node, const std::string& name, bool mandatory = false,
                                     const std::string& defaultValue = std::string());
    static QuantLib::Real getChildValueAsDouble(XMLNode* node, const std::string& name, bool mandatory = false,
                                                QuantLib::Real defaultValue = 0.0);
    static int getChildValueAsInt(XMLNode* node, const std::string& name, bool mandatory = false,
                                  int defaultValue = 0);
    static bool getChildValueAsBool(XMLNode* node, const std::string& name, bool mandatory = false,
                                    bool defaultValue = true);

    //! Returns the first child with the given name, the first child element if name is empty, or nullptr
    static XMLNode* getChildNode(XMLNode* n, const std::string& name = "");
    //! Returns all children with the given name, all child elements if name is empty
    static std::vector<XMLNode*> getChildrenNodes(XMLNode* node, const std::string& name = "");

    static std::string getNodeName(XMLNode* n);
    static std::string getNodeValue(XMLNode* node);
};

} // namespace data
} // namespace sre
