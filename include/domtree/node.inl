#if defined(DOMTREE___NODE__HPP)  &&  !defined(DOMTREE___NODE__INL)
#define DOMTREE___NODE__INL

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
 *   Inline methods of the DOM node classes.
 *
 */


inline
CDomNode::ENodeType CDomNode::GetNodeType(void) const
{
    return m_Type;
}

inline
CDomNode* CDomNode::GetParent(void)
{
    return m_Parent;
}

inline
const CDomNode* CDomNode::GetParent(void) const
{
    return m_Parent;
}

inline
CDomNode* CDomNode::GetFirstChild(void)
{
    return m_Children.empty() ? 0 : m_Children.front().GetPointer();
}

inline
const CDomNode* CDomNode::GetFirstChild(void) const
{
    return m_Children.empty() ? 0 : m_Children.front().GetPointer();
}

inline
CDomNode* CDomNode::GetLastChild(void)
{
    return m_Children.empty() ? 0 : m_Children.back().GetPointer();
}

inline
const CDomNode* CDomNode::GetLastChild(void) const
{
    return m_Children.empty() ? 0 : m_Children.back().GetPointer();
}

inline
bool CDomNode::HasChildNodes(void) const
{
    return !m_Children.empty();
}

inline
size_t CDomNode::GetChildCount(void) const
{
    return m_Children.size();
}

inline
const CDomNode::TChildren& CDomNode::GetChildren(void) const
{
    return m_Children;
}

inline
CDomNode* CDomNode::AppendChild(CDomNodeRef& child)
{
    return AppendChild(child.GetPointerOrNull());
}

inline
CDomNodeRef CDomNode::RemoveChild(CDomNodeRef& child)
{
    return RemoveChild(child.GetPointerOrNull());
}


inline
const string& CDomAttr::GetNamespaceURI(void) const
{
    return m_NamespaceURI;
}

inline
const string& CDomAttr::GetPrefix(void) const
{
    return m_Prefix;
}

inline
const string& CDomAttr::GetLocalName(void) const
{
    return m_LocalName;
}

inline
const string& CDomAttr::GetValue(void) const
{
    return m_Value;
}

inline
CDomElement* CDomAttr::GetOwnerElement(void) const
{
    return m_OwnerElement;
}


inline
const string& CDomElement::GetNamespaceURI(void) const
{
    return m_NamespaceURI;
}

inline
const string& CDomElement::GetPrefix(void) const
{
    return m_Prefix;
}

inline
const string& CDomElement::GetLocalName(void) const
{
    return m_LocalName;
}


inline
const string& CDomCharacterData::GetData(void) const
{
    return m_Data;
}

inline
size_t CDomCharacterData::GetLength(void) const
{
    return m_Data.size();
}


inline
const string& CDomProcessingInstruction::GetTarget(void) const
{
    return m_Target;
}


inline
const string& CDomDocumentType::GetName(void) const
{
    return m_Name;
}

inline
const string& CDomDocumentType::GetPublicId(void) const
{
    return m_PublicId;
}

inline
const string& CDomDocumentType::GetSystemId(void) const
{
    return m_SystemId;
}


#endif /* def DOMTREE___NODE__HPP  &&  ndef DOMTREE___NODE__INL */
