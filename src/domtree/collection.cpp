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
 *   Element matchers and live element collections.
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/ncbistr.hpp>
#include <domtree/collection.hpp>
#include <domtree/params.hpp>
#include <domtree/error_codes.hpp>


#define NCBI_USE_ERRCODE_X   DomTree_Collection


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
//  CDomMatcher
//

CDomMatcher::CDomMatcher(EMatch type, const string& value)
    : m_Type(type),
      m_Value(value)
{
    if (m_Type == eMatch_ClassNames) {
        list<string> tokens;
        NStr::Split(value, " \t\n\r\f", tokens);
        ITERATE ( list<string>, it, tokens ) {
            if ( !it->empty() ) {
                m_ClassNames.push_back(*it);
            }
        }
    }
}


CDomMatcher CDomMatcher::All(void)
{
    return CDomMatcher(eMatch_All);
}


CDomMatcher CDomMatcher::None(void)
{
    return CDomMatcher(eMatch_None);
}


CDomMatcher CDomMatcher::TagName(const string& qualified_name)
{
    return CDomMatcher(eMatch_TagName, qualified_name);
}


CDomMatcher CDomMatcher::ClassNames(const string& class_names)
{
    return CDomMatcher(eMatch_ClassNames, class_names);
}


CDomMatcher CDomMatcher::Name(const string& name)
{
    return CDomMatcher(eMatch_Name, name);
}


CDomMatcher CDomMatcher::Links(void)
{
    return CDomMatcher(eMatch_Links);
}


CDomMatcher CDomMatcher::Anchors(void)
{
    return CDomMatcher(eMatch_Anchors);
}


bool CDomMatcher::Match(const CDomElement& element) const
{
    switch ( m_Type ) {
    case eMatch_All:
        return true;
    case eMatch_None:
        return false;
    case eMatch_TagName:
        return m_Value == "*"  ||
            NStr::EqualNocase(element.GetTagName(), m_Value);
    case eMatch_ClassNames:
        if ( m_ClassNames.empty() ) {
            return false;
        }
        ITERATE ( list<string>, it, m_ClassNames ) {
            if ( !element.HasClass(*it) ) {
                return false;
            }
        }
        return true;
    case eMatch_Name:
        {{
            const string* name = element.GetAttribute("name");
            return name  &&  *name == m_Value;
        }}
    case eMatch_Links:
        return (NStr::EqualNocase(element.GetTagName(), "a")  ||
                NStr::EqualNocase(element.GetTagName(), "area"))  &&
            element.HasAttribute("href");
    case eMatch_Anchors:
        return NStr::EqualNocase(element.GetTagName(), "a")  &&
            element.HasAttribute("name");
    }
    return false;
}


/////////////////////////////////////////////////////////////////////////////
//  CDomCollection
//

CDomCollection::CDomCollection(CDomNode*               root,
                               CDomWalker::EWalkPolicy policy,
                               const CDomMatcher&      matcher,
                               bool                    include_root)
    : m_Root(root),
      m_Walker(policy),
      m_Matcher(matcher),
      m_IncludeRoot(include_root),
      m_CacheIndex(0),
      m_CacheTreeRoot(0),
      m_CacheVersion(0)
{
    return;
}


CDomCollection::~CDomCollection(void)
{
    return;
}


CRef<CDomCollection> CDomCollection::ByTagName(CDomNode* root,
                                               const string& qualified_name,
                                               bool include_root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_DepthFirst,
                            CDomMatcher::TagName(qualified_name),
                            include_root));
}


CRef<CDomCollection> CDomCollection::ByClassName(CDomNode* root,
                                                 const string& class_names,
                                                 bool include_root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_DepthFirst,
                            CDomMatcher::ClassNames(class_names),
                            include_root));
}


CRef<CDomCollection> CDomCollection::ByName(CDomNode* root,
                                            const string& name,
                                            bool include_root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_DepthFirst,
                            CDomMatcher::Name(name), include_root));
}


CRef<CDomCollection> CDomCollection::All(CDomNode* root, bool include_root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_DepthFirst,
                            CDomMatcher::All(), include_root));
}


CRef<CDomCollection> CDomCollection::Children(CDomNode* root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_Children,
                            CDomMatcher::All()));
}


CRef<CDomCollection> CDomCollection::Links(CDomNode* root, bool include_root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_DepthFirst,
                            CDomMatcher::Links(), include_root));
}


CRef<CDomCollection> CDomCollection::Anchors(CDomNode* root,
                                             bool include_root)
{
    return CRef<CDomCollection>
        (new CDomCollection(root, CDomWalker::eWalk_DepthFirst,
                            CDomMatcher::Anchors(), include_root));
}


CRef<CDomCollection> CDomCollection::Empty(void)
{
    return CRef<CDomCollection>
        (new CDomCollection(0, CDomWalker::eWalk_None,
                            CDomMatcher::None()));
}


Uint4 CDomCollection::GetLength(void)
{
    Uint4 count = 0;
    for (CDomNode* node = x_NextNode(0);  node;  node = x_NextNode(node)) {
        if ( x_Accept(node) ) {
            ++count;
        }
    }
    return count;
}


CDomElement* CDomCollection::Item(Uint4 index)
{
    if ( !m_Root ) {
        return 0;
    }

    CDomNode* node = 0;
    Uint4     pos  = 0;
    bool use_cache = TDomTreeCollectionCache::GetDefault();

    if (use_cache  &&  m_CacheElement  &&  index >= m_CacheIndex) {
        if ( x_IsCacheValid() ) {
            if (index == m_CacheIndex) {
                return m_CacheElement.GetPointer();
            }
            node = m_CacheElement.GetPointer();
            pos  = m_CacheIndex + 1;
        } else {
            ERR_POST_X(1, Info << "Collection cursor at " << m_CacheIndex
                       << " discarded: the tree has changed");
            x_ResetCache();
        }
    }

    if ( !node ) {
        _TRACE("CDomCollection::Item: scan for " << index
               << " starts from the root");
    }
    for (node = x_NextNode(node);  node;  node = x_NextNode(node)) {
        CDomElement* element = x_Accept(node);
        if ( !element ) {
            continue;
        }
        if (pos == index) {
            if ( use_cache ) {
                m_CacheIndex    = index;
                m_CacheElement.Reset(element);
                m_CacheTreeRoot = m_Root->GetTreeRoot();
                m_CacheVersion  = m_Root->GetTreeVersion();
            }
            return element;
        }
        ++pos;
    }
    return 0;
}


CDomElement* CDomCollection::NamedItem(const string& name)
{
    if ( name.empty() ) {
        return 0;
    }
    for (CDomNode* node = x_NextNode(0);  node;  node = x_NextNode(node)) {
        CDomElement* element = x_Accept(node);
        if ( !element ) {
            continue;
        }
        if (element->GetId() == name) {
            return element;
        }
        const string* name_attr = element->GetAttribute("name");
        if (name_attr  &&  *name_attr == name) {
            return element;
        }
    }
    return 0;
}


CDomCollection::TIterator CDomCollection::GetIterator(void)
{
    return TIterator(*this);
}


CDomNode* CDomCollection::x_NextNode(CDomNode* node)
{
    if ( !m_Root ) {
        return 0;
    }
    CDomNode& root = *m_Root;
    if ( !node ) {
        return m_IncludeRoot ? &root : m_Walker.GetNext(root, 0);
    }
    if (node == &root) {
        return m_Walker.GetNext(root, 0);
    }
    return m_Walker.GetNext(root, node);
}


CDomElement* CDomCollection::x_Accept(CDomNode* node) const
{
    if (node->GetNodeType() != CDomNode::eElement) {
        return 0;
    }
    CDomElement* element = static_cast<CDomElement*>(node);
    return m_Matcher.Match(*element) ? element : 0;
}


bool CDomCollection::x_IsCacheValid(void) const
{
    return m_CacheTreeRoot == m_Root->GetTreeRoot()  &&
        m_CacheVersion == m_Root->GetTreeVersion()  &&
        m_CacheElement->IsInclusiveDescendantOf(*m_Root);
}


void CDomCollection::x_ResetCache(void)
{
    m_CacheIndex = 0;
    m_CacheElement.Reset();
    m_CacheTreeRoot = 0;
    m_CacheVersion = 0;
}


END_SCOPE(domtree)
END_NCBI_SCOPE
