#ifndef DOMTREE___ATTR_MAP__HPP
#define DOMTREE___ATTR_MAP__HPP

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

/// @file attr_map.hpp
/// Attribute map of an element (DOM NamedNodeMap).


#include <domtree/node.hpp>
#include <domtree/live_iterator.hpp>
#include <vector>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
///
/// CDomAttrMap --
///
/// Ordered collection of the attributes of one element. Attributes keep
/// the order in which they were added; replacing an attribute keeps its
/// position. Every change is reported to the owner element's tree.

class NCBI_XDOMTREE_EXPORT CDomAttrMap : public CObject
{
public:
    typedef CDomAttr                         TItem;
    typedef vector< CRef<CDomAttr> >         TAttrs;
    typedef CLiveIndexIterator<CDomAttrMap>  TIterator;

    virtual ~CDomAttrMap(void);

    Uint4 GetLength(void) const;

    /// Attribute at a zero-based position, NULL past the end.
    CDomAttr*       Item(Uint4 index);
    const CDomAttr* Item(Uint4 index) const;

    /// Lookup by qualified name.
    CDomAttr*       GetNamedItem(const string& qualified_name);
    const CDomAttr* GetNamedItem(const string& qualified_name) const;

    /// Lookup by namespace and local name.
    CDomAttr*       GetNamedItemNS(const string& namespace_uri,
                                   const string& local_name);
    const CDomAttr* GetNamedItemNS(const string& namespace_uri,
                                   const string& local_name) const;

    /// Add an attribute or replace the one with the same namespace and
    /// local name. Return the replaced attribute, or NULL.
    /// Throw CDomException::eInUseAttribute if "attr" belongs to another
    /// element.
    CRef<CDomAttr> SetNamedItem(CDomAttr* attr);
    CRef<CDomAttr> SetNamedItemNS(CDomAttr* attr);

    /// Remove an attribute and return it.
    /// Throw CDomException::eNotFound if there is no such attribute.
    CRef<CDomAttr> RemoveNamedItem(const string& qualified_name);
    CRef<CDomAttr> RemoveNamedItemNS(const string& namespace_uri,
                                     const string& local_name);

    /// Iterator over the live map.
    TIterator GetIterator(void);

    /// NULL once the element is destroyed.
    CDomElement* GetOwnerElement(void) const;

private:
    friend class CDomElement;

    explicit CDomAttrMap(CDomElement* owner);

    TAttrs::iterator x_FindName(const string& qualified_name);
    TAttrs::iterator x_FindNS(const string& namespace_uri,
                              const string& local_name);
    CRef<CDomAttr> x_Remove(TAttrs::iterator it);
    // Add a free attribute without looking for one to replace.
    void x_Append(CDomAttr* attr);
    void x_Changed(void);
    // Called by the owner's destructor.
    void x_Orphan(void);

    CDomElement* m_Owner;
    TAttrs       m_Attrs;
};


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___ATTR_MAP__HPP */
