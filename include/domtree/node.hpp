#ifndef DOMTREE___NODE__HPP
#define DOMTREE___NODE__HPP

/*  $Id$
 * ===========================================================================
 *
 *                            PUBLIC DOMAIN NOTICE
 *               National Center for Biotechnology Information
 *
 *  This software/database is a "United States Government Work" under the
 *  terms of the United States Copyright Act.  It was written as part of
 *  the author's official duties as a United States Government employee and
 *  thus cannot be copyrighted.  This software/database is freely available
 *  to the public for use. The National Library of Medicine and the U.S.
 *  Government have not placed any restriction on its use or reproduction.
 *
 *  Although all reasonable efforts have been taken to ensure the accuracy
 *  and reliability of the software and data, the NLM and the U.S.
 *  Government do not and cannot warrant the performance or results that
 *  may be obtained by using this software or data. The NLM and the U.S.
 *  Government disclaim all warranties, express or implied, including
 *  warranties of performance, merchantability or fitness for any particular
 *  purpose.
 *
 *  Please cite the author in any work or product based on this material.
 *
 * ===========================================================================
 *
 * Authors:  DOM tree library maintainers
 *
 */

/// @file node.hpp
/// DOM node graph.
///
/// Nodes are reference counted (CObject). A parent owns its children
/// through CRef; the parent and sibling links are plain back pointers
/// which are cleared as soon as a node is detached, so a detached node
/// reports no parent and no siblings.


#include <corelib/ncbistd.hpp>
#include <corelib/ncbiobj.hpp>
#include <domtree/domtree_export.h>
#include <list>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


class CDomNode;
class CDomElement;
class CDomAttr;
class CDomAttrMap;

typedef CRef<CDomNode> CDomNodeRef;


/////////////////////////////////////////////////////////////////////////////
///
/// CDomNode --
///
/// Base class for all nodes of a DOM tree.

class NCBI_XDOMTREE_EXPORT CDomNode : public CObject
{
public:
    typedef list<CDomNodeRef> TChildren;
    typedef Uint8             TTreeVersion;

    /// DOM node type codes.
    enum ENodeType {
        eElement               = 1,
        eAttribute             = 2,
        eText                  = 3,
        eCDataSection          = 4,
        eEntityReference       = 5,   ///< NodeFilter bit only
        eEntity                = 6,   ///< NodeFilter bit only
        eProcessingInstruction = 7,
        eComment               = 8,
        eDocument              = 9,
        eDocumentType          = 10,
        eDocumentFragment      = 11,
        eNotation              = 12   ///< NodeFilter bit only
    };

    virtual ~CDomNode(void);

    ENodeType GetNodeType(void) const;

    /// Qualified name for elements and attributes, target for processing
    /// instructions, name for document types, "#text", "#comment" etc.
    /// for the others.
    virtual string GetNodeName(void) const = 0;

    /// Whether nodes can be inserted under this one.
    virtual bool CanHaveChildren(void) const;

    // Navigation. All lookups are total: a missing relative is NULL.

    CDomNode*       GetParent(void);
    const CDomNode* GetParent(void) const;
    CDomNode*       GetFirstChild(void);
    const CDomNode* GetFirstChild(void) const;
    CDomNode*       GetLastChild(void);
    const CDomNode* GetLastChild(void) const;
    CDomNode*       GetNextSibling(void);
    const CDomNode* GetNextSibling(void) const;
    CDomNode*       GetPreviousSibling(void);
    const CDomNode* GetPreviousSibling(void) const;

    bool   HasChildNodes(void) const;
    size_t GetChildCount(void) const;
    const TChildren& GetChildren(void) const;

    /// TRUE if this node is "ancestor" itself or lies in its subtree.
    bool IsInclusiveDescendantOf(const CDomNode& ancestor) const;

    /// Topmost ancestor (this node if it is detached).
    CDomNode*       GetTreeRoot(void);
    const CDomNode* GetTreeRoot(void) const;

    /// Mutation counter of the tree this node belongs to.
    ///
    /// Changes whenever a node is inserted into or removed from the tree,
    /// or an attribute of one of its elements changes. Values are never
    /// reused, so (tree root, version) identifies a tree state.
    TTreeVersion GetTreeVersion(void) const;

    // Mutation.

    /// Add a node to the end of the children list.
    /// The node is first removed from its current parent; a document
    /// fragment is replaced by its children.
    /// Returns 'this' for chained AppendChild().
    CDomNode* AppendChild(CDomNode* child);
    CDomNode* AppendChild(CDomNodeRef& child);

    /// Insert a node before "ref", or at the end if "ref" is NULL.
    /// Throw CDomException::eNotFound if "ref" is not a child.
    /// Returns the inserted node.
    CDomNode* InsertBefore(CDomNode* child, CDomNode* ref);

    /// Detach a child node.
    /// Throw CDomException::eNotFound if it is not a child of this node.
    /// Return smart pointer to the removed child node.
    CDomNodeRef RemoveChild(CDomNode* child);
    CDomNodeRef RemoveChild(CDomNodeRef& child);

    /// Put "new_child" in place of "old_child" and return "old_child".
    CDomNodeRef ReplaceChild(CDomNode* new_child, CDomNode* old_child);

    void RemoveAllChildren(void);

    /// Structural equality, see IsEqualNode() in node_equal.hpp.
    /// NULL is never equal.
    bool IsEqualNode(const CDomNode* other) const;

protected:
    CDomNode(ENodeType type);

    /// Register a change of this node's tree.
    void x_TouchTree(void);

private:
    friend class CDomAttrMap;
    friend class CDomAttr;

    void x_CheckInsertion(const CDomNode* child) const;
    void x_Insert(TChildren::iterator pos, CDomNode* child);
    void x_InsertOne(TChildren::iterator pos, CDomNode* child);
    CDomNodeRef x_Remove(CDomNode* child);

    ENodeType           m_Type;
    CDomNode*           m_Parent;        ///< Not owned, NULL when detached
    TChildren           m_Children;      ///< Child nodes
    TChildren::iterator m_SelfInParent;  ///< Valid while m_Parent is set
    TTreeVersion        m_TreeVersion;   ///< Meaningful on tree roots only

    // To prevent copy constructor.
    CDomNode(const CDomNode& node);
    // To prevent assignment operator.
    CDomNode& operator=(const CDomNode& node);
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomAttr --
///
/// Element attribute. Attributes are nodes, but never tree children:
/// they are kept in the attribute map of their owner element.

class NCBI_XDOMTREE_EXPORT CDomAttr : public CDomNode
{
public:
    /// No namespace: the whole name is the local name, the prefix is empty.
    CDomAttr(const string& qualified_name, const string& value = kEmptyStr);
    /// "qualified_name" is split into prefix and local name at the colon.
    CDomAttr(const string& namespace_uri, const string& qualified_name,
             const string& value);
    virtual ~CDomAttr(void);

    virtual string GetNodeName(void) const override;
    virtual bool CanHaveChildren(void) const override;

    const string& GetNamespaceURI(void) const;
    const string& GetPrefix(void) const;
    const string& GetLocalName(void) const;
    string        GetName(void) const;

    const string& GetValue(void) const;
    void SetValue(const string& value);

    /// NULL while the attribute is not attached to an element.
    CDomElement* GetOwnerElement(void) const;

private:
    friend class CDomAttrMap;

    string       m_NamespaceURI;
    string       m_Prefix;
    string       m_LocalName;
    string       m_Value;
    CDomElement* m_OwnerElement;
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomElement --

class NCBI_XDOMTREE_EXPORT CDomElement : public CDomNode
{
public:
    /// Same naming rules as CDomAttr.
    CDomElement(const string& qualified_name);
    CDomElement(const string& namespace_uri, const string& qualified_name);
    virtual ~CDomElement(void);

    virtual string GetNodeName(void) const override;

    const string& GetNamespaceURI(void) const;
    const string& GetPrefix(void) const;
    const string& GetLocalName(void) const;
    string        GetTagName(void) const;

    bool HasAttributes(void) const;
    CDomAttrMap& Attributes(void);
    const CDomAttrMap& Attributes(void) const;

    // Retrieve attribute.
    bool HasAttribute(const string& name) const;
    /// NULL if there is no such attribute.
    const string* GetAttribute(const string& name) const;
    /// Value of the "id" attribute, empty string if it is not set.
    const string& GetId(void) const;
    /// TRUE if "class_name" is one of the whitespace separated tokens
    /// of the "class" attribute.
    bool HasClass(const string& class_name) const;

    // Set attribute.
    void SetAttribute(const string& name, const string& value);
    void SetAttributeNS(const string& namespace_uri,
                        const string& qualified_name,
                        const string& value);
    /// Return FALSE if there was no such attribute.
    bool RemoveAttribute(const string& name);

private:
    string            m_NamespaceURI;
    string            m_Prefix;
    string            m_LocalName;
    CRef<CDomAttrMap> m_Attributes;
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomCharacterData --
///
/// Common part of text, CDATA section, comment and processing
/// instruction nodes.

class NCBI_XDOMTREE_EXPORT CDomCharacterData : public CDomNode
{
public:
    virtual ~CDomCharacterData(void);

    virtual bool CanHaveChildren(void) const override;

    const string& GetData(void) const;
    void SetData(const string& data);
    size_t GetLength(void) const;

protected:
    CDomCharacterData(ENodeType type, const string& data);

private:
    string m_Data;
};


class NCBI_XDOMTREE_EXPORT CDomText : public CDomCharacterData
{
public:
    CDomText(const string& data = kEmptyStr);
    virtual string GetNodeName(void) const override;
};


class NCBI_XDOMTREE_EXPORT CDomCDataSection : public CDomCharacterData
{
public:
    CDomCDataSection(const string& data = kEmptyStr);
    virtual string GetNodeName(void) const override;
};


class NCBI_XDOMTREE_EXPORT CDomComment : public CDomCharacterData
{
public:
    CDomComment(const string& data = kEmptyStr);
    virtual string GetNodeName(void) const override;
};


class NCBI_XDOMTREE_EXPORT CDomProcessingInstruction : public CDomCharacterData
{
public:
    CDomProcessingInstruction(const string& target,
                              const string& data = kEmptyStr);
    virtual string GetNodeName(void) const override;

    const string& GetTarget(void) const;

private:
    string m_Target;
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomDocumentType --

class NCBI_XDOMTREE_EXPORT CDomDocumentType : public CDomNode
{
public:
    CDomDocumentType(const string& name,
                     const string& public_id = kEmptyStr,
                     const string& system_id = kEmptyStr);
    virtual ~CDomDocumentType(void);

    virtual string GetNodeName(void) const override;
    virtual bool CanHaveChildren(void) const override;

    const string& GetName(void) const;
    const string& GetPublicId(void) const;
    const string& GetSystemId(void) const;

private:
    string m_Name;
    string m_PublicId;
    string m_SystemId;
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomDocument, CDomDocumentFragment --
///
/// Pure containers.

class NCBI_XDOMTREE_EXPORT CDomDocument : public CDomNode
{
public:
    CDomDocument(void);
    virtual ~CDomDocument(void);
    virtual string GetNodeName(void) const override;
};


class NCBI_XDOMTREE_EXPORT CDomDocumentFragment : public CDomNode
{
public:
    CDomDocumentFragment(void);
    virtual ~CDomDocumentFragment(void);
    virtual string GetNodeName(void) const override;
};


// Inline functions are defined here:
#include <domtree/node.inl>


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___NODE__HPP */
