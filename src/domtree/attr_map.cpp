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
 *   Attribute map of an element.
 *
 */

#include <ncbi_pch.hpp>
#include <domtree/attr_map.hpp>
#include <domtree/domtree_exception.hpp>


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


CDomAttrMap::CDomAttrMap(CDomElement* owner)
    : m_Owner(owner)
{
    return;
}


CDomAttrMap::~CDomAttrMap(void)
{
    return;
}


Uint4 CDomAttrMap::GetLength(void) const
{
    return (Uint4)m_Attrs.size();
}


CDomAttr* CDomAttrMap::Item(Uint4 index)
{
    return index < m_Attrs.size() ? m_Attrs[index].GetPointer() : 0;
}


const CDomAttr* CDomAttrMap::Item(Uint4 index) const
{
    return const_cast<CDomAttrMap*>(this)->Item(index);
}


CDomAttr* CDomAttrMap::GetNamedItem(const string& qualified_name)
{
    TAttrs::iterator it = x_FindName(qualified_name);
    return it == m_Attrs.end() ? 0 : it->GetPointer();
}


const CDomAttr* CDomAttrMap::GetNamedItem(const string& qualified_name) const
{
    return const_cast<CDomAttrMap*>(this)->GetNamedItem(qualified_name);
}


CDomAttr* CDomAttrMap::GetNamedItemNS(const string& namespace_uri,
                                      const string& local_name)
{
    TAttrs::iterator it = x_FindNS(namespace_uri, local_name);
    return it == m_Attrs.end() ? 0 : it->GetPointer();
}


const CDomAttr* CDomAttrMap::GetNamedItemNS(const string& namespace_uri,
                                            const string& local_name) const
{
    return const_cast<CDomAttrMap*>(this)->GetNamedItemNS(namespace_uri,
                                                          local_name);
}


CRef<CDomAttr> CDomAttrMap::SetNamedItem(CDomAttr* attr)
{
    if ( !attr ) {
        NCBI_THROW(CDomException, eNullPtr, "Null attribute cannot be set");
    }
    if ( attr->m_OwnerElement  &&  attr->m_OwnerElement != m_Owner ) {
        NCBI_THROW(CDomException, eInUseAttribute,
                   "Attribute " + attr->GetName() +
                   " is in use by another element");
    }
    CRef<CDomAttr> hold(attr);
    CRef<CDomAttr> replaced;
    TAttrs::iterator it =
        x_FindNS(attr->GetNamespaceURI(), attr->GetLocalName());
    if (it != m_Attrs.end()) {
        if (it->GetPointer() == attr) {
            return hold;
        }
        replaced = *it;
        replaced->m_OwnerElement = 0;
        *it = hold;
    } else {
        m_Attrs.push_back(hold);
    }
    attr->m_OwnerElement = m_Owner;
    x_Changed();
    return replaced;
}


CRef<CDomAttr> CDomAttrMap::SetNamedItemNS(CDomAttr* attr)
{
    return SetNamedItem(attr);
}


CRef<CDomAttr> CDomAttrMap::RemoveNamedItem(const string& qualified_name)
{
    TAttrs::iterator it = x_FindName(qualified_name);
    if (it == m_Attrs.end()) {
        NCBI_THROW(CDomException, eNotFound,
                   "No attribute named " + qualified_name);
    }
    return x_Remove(it);
}


CRef<CDomAttr> CDomAttrMap::RemoveNamedItemNS(const string& namespace_uri,
                                              const string& local_name)
{
    TAttrs::iterator it = x_FindNS(namespace_uri, local_name);
    if (it == m_Attrs.end()) {
        NCBI_THROW(CDomException, eNotFound,
                   "No attribute {" + namespace_uri + "}" + local_name);
    }
    return x_Remove(it);
}


CDomAttrMap::TIterator CDomAttrMap::GetIterator(void)
{
    return TIterator(*this);
}


CDomElement* CDomAttrMap::GetOwnerElement(void) const
{
    return m_Owner;
}


CDomAttrMap::TAttrs::iterator
CDomAttrMap::x_FindName(const string& qualified_name)
{
    NON_CONST_ITERATE ( TAttrs, it, m_Attrs ) {
        if ((*it)->GetName() == qualified_name) {
            return it;
        }
    }
    return m_Attrs.end();
}


CDomAttrMap::TAttrs::iterator
CDomAttrMap::x_FindNS(const string& namespace_uri, const string& local_name)
{
    NON_CONST_ITERATE ( TAttrs, it, m_Attrs ) {
        if ((*it)->GetNamespaceURI() == namespace_uri  &&
            (*it)->GetLocalName()    == local_name) {
            return it;
        }
    }
    return m_Attrs.end();
}


CRef<CDomAttr> CDomAttrMap::x_Remove(TAttrs::iterator it)
{
    CRef<CDomAttr> attr(*it);
    m_Attrs.erase(it);
    attr->m_OwnerElement = 0;
    x_Changed();
    return attr;
}


void CDomAttrMap::x_Append(CDomAttr* attr)
{
    m_Attrs.push_back(CRef<CDomAttr>(attr));
    attr->m_OwnerElement = m_Owner;
    x_Changed();
}


void CDomAttrMap::x_Changed(void)
{
    if ( m_Owner ) {
        m_Owner->x_TouchTree();
    }
}


void CDomAttrMap::x_Orphan(void)
{
    m_Owner = 0;
    NON_CONST_ITERATE ( TAttrs, it, m_Attrs ) {
        (*it)->m_OwnerElement = 0;
    }
}


END_SCOPE(domtree)
END_NCBI_SCOPE
