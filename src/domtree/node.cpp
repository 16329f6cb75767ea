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
 * File Description:
 *   DOM node graph: linkage, mutation and the concrete node kinds.
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/ncbistr.hpp>
#include <domtree/node.hpp>
#include <domtree/attr_map.hpp>
#include <domtree/node_equal.hpp>
#include <domtree/domtree_exception.hpp>
#include <domtree/params.hpp>
#include <domtree/error_codes.hpp>


#define NCBI_USE_ERRCODE_X   DomTree_Node


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


// Tree versions are never reused: a (tree root, version) pair recorded
// by a consumer cannot match again once the tree has changed.
// Plain counter: trees are not shared between threads.
static CDomNode::TTreeVersion s_LastTreeVersion = 0;

static CDomNode::TTreeVersion s_NewTreeVersion(void)
{
    return ++s_LastTreeVersion;
}


static void s_SplitQName(const string& qualified_name,
                         string& prefix, string& local_name)
{
    SIZE_TYPE colon = qualified_name.find(':');
    if (colon == NPOS) {
        prefix.erase();
        local_name = qualified_name;
    } else {
        prefix     = qualified_name.substr(0, colon);
        local_name = qualified_name.substr(colon + 1);
    }
}


static string s_QName(const string& prefix, const string& local_name)
{
    return prefix.empty() ? local_name : prefix + ':' + local_name;
}


/////////////////////////////////////////////////////////////////////////////
//  CDomNode
//

CDomNode::CDomNode(ENodeType type)
    : m_Type(type),
      m_Parent(0),
      m_TreeVersion(s_NewTreeVersion())
{
    return;
}


CDomNode::~CDomNode(void)
{
    // Children still referenced from elsewhere become roots of their own.
    NON_CONST_ITERATE ( TChildren, it, m_Children ) {
        (*it)->m_Parent = 0;
        (*it)->m_TreeVersion = s_NewTreeVersion();
    }
}


bool CDomNode::CanHaveChildren(void) const
{
    return true;
}


CDomNode* CDomNode::GetNextSibling(void)
{
    if ( !m_Parent ) {
        return 0;
    }
    TChildren::iterator it = m_SelfInParent;
    if ( ++it == m_Parent->m_Children.end() ) {
        return 0;
    }
    return it->GetPointer();
}


const CDomNode* CDomNode::GetNextSibling(void) const
{
    return const_cast<CDomNode*>(this)->GetNextSibling();
}


CDomNode* CDomNode::GetPreviousSibling(void)
{
    if ( !m_Parent ) {
        return 0;
    }
    TChildren::iterator it = m_SelfInParent;
    if ( it == m_Parent->m_Children.begin() ) {
        return 0;
    }
    return (--it)->GetPointer();
}


const CDomNode* CDomNode::GetPreviousSibling(void) const
{
    return const_cast<CDomNode*>(this)->GetPreviousSibling();
}


bool CDomNode::IsInclusiveDescendantOf(const CDomNode& ancestor) const
{
    for (const CDomNode* node = this;  node;  node = node->m_Parent) {
        if (node == &ancestor) {
            return true;
        }
    }
    return false;
}


CDomNode* CDomNode::GetTreeRoot(void)
{
    CDomNode* node = this;
    while ( node->m_Parent ) {
        node = node->m_Parent;
    }
    return node;
}


const CDomNode* CDomNode::GetTreeRoot(void) const
{
    return const_cast<CDomNode*>(this)->GetTreeRoot();
}


CDomNode::TTreeVersion CDomNode::GetTreeVersion(void) const
{
    return GetTreeRoot()->m_TreeVersion;
}


void CDomNode::x_TouchTree(void)
{
    GetTreeRoot()->m_TreeVersion = s_NewTreeVersion();
}


CDomNode* CDomNode::AppendChild(CDomNode* child)
{
    InsertBefore(child, 0);
    return this;
}


CDomNode* CDomNode::InsertBefore(CDomNode* child, CDomNode* ref)
{
    if ( !child ) {
        NCBI_THROW(CDomException, eNullPtr, "Null node cannot be inserted");
    }
    if ( ref  &&  ref->m_Parent != this ) {
        NCBI_THROW(CDomException, eNotFound,
                   "Reference node is not a child of this node");
    }
    x_CheckInsertion(child);
    if ( ref == child ) {
        ref = child->GetNextSibling();
    }
    x_Insert(ref ? ref->m_SelfInParent : m_Children.end(), child);
    return child;
}


CDomNodeRef CDomNode::RemoveChild(CDomNode* child)
{
    if ( !child ) {
        NCBI_THROW(CDomException, eNullPtr, "Null node cannot be removed");
    }
    if ( child->m_Parent != this ) {
        NCBI_THROW(CDomException, eNotFound,
                   "Node to remove is not a child of this node");
    }
    return x_Remove(child);
}


CDomNodeRef CDomNode::ReplaceChild(CDomNode* new_child, CDomNode* old_child)
{
    if ( !new_child  ||  !old_child ) {
        NCBI_THROW(CDomException, eNullPtr,
                   "Null node passed to ReplaceChild()");
    }
    if ( old_child->m_Parent != this ) {
        NCBI_THROW(CDomException, eNotFound,
                   "Node to replace is not a child of this node");
    }
    if ( new_child == old_child ) {
        return CDomNodeRef(old_child);
    }
    x_CheckInsertion(new_child);

    CDomNode* ref = old_child->GetNextSibling();
    if ( ref == new_child ) {
        ref = new_child->GetNextSibling();
    }
    CDomNodeRef removed = x_Remove(old_child);
    x_Insert(ref ? ref->m_SelfInParent : m_Children.end(), new_child);
    return removed;
}


void CDomNode::RemoveAllChildren(void)
{
    if ( m_Children.empty() ) {
        return;
    }
    x_TouchTree();
    NON_CONST_ITERATE ( TChildren, it, m_Children ) {
        (*it)->m_Parent = 0;
        (*it)->m_TreeVersion = s_NewTreeVersion();
    }
    m_Children.clear();
}


bool CDomNode::IsEqualNode(const CDomNode* other) const
{
    return other  &&  domtree::IsEqualNode(*this, *other);
}


void CDomNode::x_CheckInsertion(const CDomNode* child) const
{
    if ( !CanHaveChildren() ) {
        NCBI_THROW(CDomException, eHierarchyRequest,
                   GetNodeName() + " node cannot have children");
    }
    switch ( child->GetNodeType() ) {
    case eDocument:
    case eAttribute:
        NCBI_THROW(CDomException, eHierarchyRequest,
                   child->GetNodeName() + " node cannot be a child");
    case eDocumentType:
        if (GetNodeType() != eDocument) {
            NCBI_THROW(CDomException, eHierarchyRequest,
                       "Document type node can only be a child of a document");
        }
        break;
    default:
        break;
    }

    // Check endless recursion
    if ( TDomTreeCheckRecursion::GetDefault() ) {
        if ( IsInclusiveDescendantOf(*child) ) {
            NCBI_THROW(CDomException, eHierarchyRequest,
                "Endless recursion: inserted node contains current node");
        }
    } else {
        ERR_POST_X_ONCE(1, Warning <<
                        "Endless recursion check is disabled, "
                        "cyclic insertions are not detected");
    }
}


void CDomNode::x_Insert(TChildren::iterator pos, CDomNode* child)
{
    CDomNodeRef hold(child);
    if (child->GetNodeType() == eDocumentFragment) {
        while ( child->HasChildNodes() ) {
            x_InsertOne(pos, child->m_Children.front().GetPointer());
        }
    } else {
        x_InsertOne(pos, child);
    }
    x_TouchTree();
}


void CDomNode::x_InsertOne(TChildren::iterator pos, CDomNode* child)
{
    CDomNodeRef hold(child);
    if ( child->m_Parent ) {
        child->m_Parent->x_Remove(child);
    }
    child->m_SelfInParent = m_Children.insert(pos, hold);
    child->m_Parent = this;
}


CDomNodeRef CDomNode::x_Remove(CDomNode* child)
{
    CDomNodeRef hold(child);
    x_TouchTree();
    m_Children.erase(child->m_SelfInParent);
    child->m_Parent = 0;
    child->m_SelfInParent = TChildren::iterator();
    child->m_TreeVersion = s_NewTreeVersion();
    return hold;
}


/////////////////////////////////////////////////////////////////////////////
//  CDomAttr
//

CDomAttr::CDomAttr(const string& qualified_name, const string& value)
    : CDomNode(eAttribute),
      m_LocalName(qualified_name),
      m_Value(value),
      m_OwnerElement(0)
{
    return;
}


CDomAttr::CDomAttr(const string& namespace_uri,
                   const string& qualified_name,
                   const string& value)
    : CDomNode(eAttribute),
      m_NamespaceURI(namespace_uri),
      m_Value(value),
      m_OwnerElement(0)
{
    s_SplitQName(qualified_name, m_Prefix, m_LocalName);
}


CDomAttr::~CDomAttr(void)
{
    return;
}


string CDomAttr::GetNodeName(void) const
{
    return GetName();
}


bool CDomAttr::CanHaveChildren(void) const
{
    return false;
}


string CDomAttr::GetName(void) const
{
    return s_QName(m_Prefix, m_LocalName);
}


void CDomAttr::SetValue(const string& value)
{
    m_Value = value;
    if ( m_OwnerElement ) {
        m_OwnerElement->x_TouchTree();
    }
}


/////////////////////////////////////////////////////////////////////////////
//  CDomElement
//

CDomElement::CDomElement(const string& qualified_name)
    : CDomNode(eElement),
      m_LocalName(qualified_name),
      m_Attributes(new CDomAttrMap(this))
{
    return;
}


CDomElement::CDomElement(const string& namespace_uri,
                         const string& qualified_name)
    : CDomNode(eElement),
      m_NamespaceURI(namespace_uri),
      m_Attributes(new CDomAttrMap(this))
{
    s_SplitQName(qualified_name, m_Prefix, m_LocalName);
}


CDomElement::~CDomElement(void)
{
    m_Attributes->x_Orphan();
}


string CDomElement::GetNodeName(void) const
{
    return GetTagName();
}


string CDomElement::GetTagName(void) const
{
    return s_QName(m_Prefix, m_LocalName);
}


bool CDomElement::HasAttributes(void) const
{
    return m_Attributes->GetLength() > 0;
}


CDomAttrMap& CDomElement::Attributes(void)
{
    return *m_Attributes;
}


const CDomAttrMap& CDomElement::Attributes(void) const
{
    return *m_Attributes;
}


bool CDomElement::HasAttribute(const string& name) const
{
    return m_Attributes->GetNamedItem(name) != 0;
}


const string* CDomElement::GetAttribute(const string& name) const
{
    const CDomAttr* attr = m_Attributes->GetNamedItem(name);
    return attr ? &attr->GetValue() : 0;
}


const string& CDomElement::GetId(void) const
{
    const string* id = GetAttribute("id");
    return id ? *id : NcbiEmptyString;
}


bool CDomElement::HasClass(const string& class_name) const
{
    const string* value = GetAttribute("class");
    if ( !value  ||  class_name.empty() ) {
        return false;
    }
    list<string> classes;
    NStr::Split(*value, " \t\n\r\f", classes);
    ITERATE ( list<string>, it, classes ) {
        if (*it == class_name) {
            return true;
        }
    }
    return false;
}


void CDomElement::SetAttribute(const string& name, const string& value)
{
    CDomAttr* attr = m_Attributes->GetNamedItem(name);
    if ( attr ) {
        attr->SetValue(value);
        return;
    }
    CRef<CDomAttr> new_attr(new CDomAttr(name, value));
    m_Attributes->x_Append(new_attr.GetPointer());
}


void CDomElement::SetAttributeNS(const string& namespace_uri,
                                 const string& qualified_name,
                                 const string& value)
{
    string prefix, local_name;
    s_SplitQName(qualified_name, prefix, local_name);
    CDomAttr* attr = m_Attributes->GetNamedItemNS(namespace_uri, local_name);
    if ( attr ) {
        attr->SetValue(value);
        return;
    }
    CRef<CDomAttr> new_attr(new CDomAttr(namespace_uri, qualified_name, value));
    m_Attributes->SetNamedItemNS(new_attr.GetPointer());
}


bool CDomElement::RemoveAttribute(const string& name)
{
    if ( !m_Attributes->GetNamedItem(name) ) {
        return false;
    }
    m_Attributes->RemoveNamedItem(name);
    return true;
}


/////////////////////////////////////////////////////////////////////////////
//  Character data
//

CDomCharacterData::CDomCharacterData(ENodeType type, const string& data)
    : CDomNode(type),
      m_Data(data)
{
    return;
}


CDomCharacterData::~CDomCharacterData(void)
{
    return;
}


bool CDomCharacterData::CanHaveChildren(void) const
{
    return false;
}


void CDomCharacterData::SetData(const string& data)
{
    m_Data = data;
}


CDomText::CDomText(const string& data)
    : CDomCharacterData(eText, data)
{
    return;
}


string CDomText::GetNodeName(void) const
{
    return "#text";
}


CDomCDataSection::CDomCDataSection(const string& data)
    : CDomCharacterData(eCDataSection, data)
{
    return;
}


string CDomCDataSection::GetNodeName(void) const
{
    return "#cdata-section";
}


CDomComment::CDomComment(const string& data)
    : CDomCharacterData(eComment, data)
{
    return;
}


string CDomComment::GetNodeName(void) const
{
    return "#comment";
}


CDomProcessingInstruction::CDomProcessingInstruction(const string& target,
                                                     const string& data)
    : CDomCharacterData(eProcessingInstruction, data),
      m_Target(target)
{
    return;
}


string CDomProcessingInstruction::GetNodeName(void) const
{
    return m_Target;
}


/////////////////////////////////////////////////////////////////////////////
//  Document type, document, fragment
//

CDomDocumentType::CDomDocumentType(const string& name,
                                   const string& public_id,
                                   const string& system_id)
    : CDomNode(eDocumentType),
      m_Name(name),
      m_PublicId(public_id),
      m_SystemId(system_id)
{
    return;
}


CDomDocumentType::~CDomDocumentType(void)
{
    return;
}


string CDomDocumentType::GetNodeName(void) const
{
    return m_Name;
}


bool CDomDocumentType::CanHaveChildren(void) const
{
    return false;
}


CDomDocument::CDomDocument(void)
    : CDomNode(eDocument)
{
    return;
}


CDomDocument::~CDomDocument(void)
{
    return;
}


string CDomDocument::GetNodeName(void) const
{
    return "#document";
}


CDomDocumentFragment::CDomDocumentFragment(void)
    : CDomNode(eDocumentFragment)
{
    return;
}


CDomDocumentFragment::~CDomDocumentFragment(void)
{
    return;
}


string CDomDocumentFragment::GetNodeName(void) const
{
    return "#document-fragment";
}


END_SCOPE(domtree)
END_NCBI_SCOPE
