#ifndef DOMTREE___COLLECTION__HPP
#define DOMTREE___COLLECTION__HPP

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

/// @file collection.hpp
/// Live collection of elements (DOM HTMLCollection).


#include <domtree/node.hpp>
#include <domtree/walker.hpp>
#include <domtree/live_iterator.hpp>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
///
/// CDomMatcher --
///
/// Element predicate of a collection.

class NCBI_XDOMTREE_EXPORT CDomMatcher
{
public:
    enum EMatch {
        eMatch_All,
        eMatch_None,
        eMatch_TagName,     ///< Case-insensitive, "*" matches any tag
        eMatch_ClassNames,  ///< Every listed class is required
        eMatch_Name,        ///< "name" attribute equality
        eMatch_Links,       ///< <a> and <area> with "href"
        eMatch_Anchors      ///< <a> with "name"
    };

    static CDomMatcher All(void);
    static CDomMatcher None(void);
    static CDomMatcher TagName(const string& qualified_name);
    /// "class_names" is a whitespace separated list; an empty list
    /// matches nothing.
    static CDomMatcher ClassNames(const string& class_names);
    static CDomMatcher Name(const string& name);
    static CDomMatcher Links(void);
    static CDomMatcher Anchors(void);

    EMatch GetType(void) const { return m_Type; }

    bool Match(const CDomElement& element) const;

private:
    CDomMatcher(EMatch type, const string& value = kEmptyStr);

    EMatch       m_Type;
    string       m_Value;
    list<string> m_ClassNames;
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomCollection --
///
/// Elements found by walking the subtree of a root node with one of the
/// CDomWalker policies and keeping those accepted by a matcher.
///
/// The collection is live: nothing is stored but the last position
/// returned by Item(), which lets a forward scan resume instead of
/// restarting. That position is dropped as soon as the tree changes.

class NCBI_XDOMTREE_EXPORT CDomCollection : public CObject
{
public:
    typedef CDomElement                         TItem;
    typedef CLiveIndexIterator<CDomCollection>  TIterator;

    /// A NULL root makes the collection permanently empty.
    CDomCollection(CDomNode*               root,
                   CDomWalker::EWalkPolicy policy,
                   const CDomMatcher&      matcher,
                   bool                    include_root = false);
    virtual ~CDomCollection(void);

    // Factories.

    static CRef<CDomCollection> ByTagName(CDomNode* root,
                                          const string& qualified_name,
                                          bool include_root = false);
    static CRef<CDomCollection> ByClassName(CDomNode* root,
                                            const string& class_names,
                                            bool include_root = false);
    static CRef<CDomCollection> ByName(CDomNode* root, const string& name,
                                       bool include_root = false);
    static CRef<CDomCollection> All(CDomNode* root,
                                    bool include_root = false);
    /// Child elements of root.
    static CRef<CDomCollection> Children(CDomNode* root);
    static CRef<CDomCollection> Links(CDomNode* root,
                                      bool include_root = false);
    static CRef<CDomCollection> Anchors(CDomNode* root,
                                        bool include_root = false);
    static CRef<CDomCollection> Empty(void);

    /// Count of matching elements (walks the whole collection).
    Uint4 GetLength(void);

    /// Element at a zero-based position, NULL past the end.
    CDomElement* Item(Uint4 index);

    /// First element whose "id" or "name" attribute is "name".
    CDomElement* NamedItem(const string& name);

    TIterator GetIterator(void);

    CDomNode* GetRoot(void) const { return m_Root.GetPointerOrNull(); }
    const CDomWalker& GetWalker(void) const { return m_Walker; }
    const CDomMatcher& GetMatcher(void) const { return m_Matcher; }

private:
    CDomNode*    x_NextNode(CDomNode* node);
    CDomElement* x_Accept(CDomNode* node) const;
    bool         x_IsCacheValid(void) const;
    void         x_ResetCache(void);

    CRef<CDomNode> m_Root;
    CDomWalker     m_Walker;
    CDomMatcher    m_Matcher;
    bool           m_IncludeRoot;

    // Last position returned by Item()
    Uint4                  m_CacheIndex;
    CRef<CDomElement>      m_CacheElement;
    const CDomNode*        m_CacheTreeRoot;
    CDomNode::TTreeVersion m_CacheVersion;
};


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___COLLECTION__HPP */
