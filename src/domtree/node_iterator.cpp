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
 *   NodeFilter and NodeIterator.
 *
 */

#include <ncbi_pch.hpp>
#include <domtree/node_iterator.hpp>
#include <domtree/walker.hpp>
#include <domtree/domtree_exception.hpp>
#include <domtree/error_codes.hpp>


#define NCBI_USE_ERRCODE_X   DomTree_Iterator


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
//  CDomNodeFilter
//

CDomNodeFilter::~CDomNodeFilter(void)
{
    return;
}


CDomNodeFilter::TWhatToShow
CDomNodeFilter::GetShowFlag(CDomNode::ENodeType type)
{
    return TWhatToShow(1) << (int(type) - 1);
}


CDomFunctionFilter::CDomFunctionFilter(const TFunction& func)
    : m_Function(func)
{
    return;
}


CDomNodeFilter::EFilterResult
CDomFunctionFilter::AcceptNode(const CDomNode& node)
{
    return m_Function ? m_Function(node) : eFilter_Accept;
}


/////////////////////////////////////////////////////////////////////////////
//  CDomNodeIterator
//

bool CDomNodeIterator::SNodePointer::MoveToNext(CDomNode& root)
{
    if ( !node ) {
        return false;
    }
    if ( is_pointer_before_node ) {
        is_pointer_before_node = false;
        return true;
    }
    node.Reset(CDomWalker::NextDepthFirst(root, node.GetPointer()));
    return node.NotEmpty();
}


bool CDomNodeIterator::SNodePointer::MoveToPrevious(CDomNode& root)
{
    if ( !node ) {
        return false;
    }
    if ( !is_pointer_before_node ) {
        is_pointer_before_node = true;
        return true;
    }
    node.Reset(CDomWalker::PreviousInTreeOrder(root, node.GetPointer()));
    return node.NotEmpty();
}


CDomNodeIterator::CDomNodeIterator(CDomNode&       root,
                                   TWhatToShow     what_to_show,
                                   CDomNodeFilter* filter)
    : m_Root(&root),
      m_WhatToShow(what_to_show),
      m_Filter(filter),
      m_Active(false)
{
    m_Reference.node.Reset(&root);
}


CDomNodeIterator::~CDomNodeIterator(void)
{
    return;
}


namespace {

// Marks the filter as running for the lifetime of the object.
class CFilterActiveGuard
{
public:
    CFilterActiveGuard(bool& active)
        : m_Active(active)
        {
            m_Active = true;
        }
    ~CFilterActiveGuard(void)
        {
            m_Active = false;
        }
private:
    bool& m_Active;
};

}


CDomNodeIterator::EFilterResult
CDomNodeIterator::Verify(const CDomNode& node)
{
    if ( m_Active ) {
        NCBI_THROW(CDomException, eInvalidState,
                   "Node filter invoked recursively");
    }
    if ( !(m_WhatToShow & CDomNodeFilter::GetShowFlag(node.GetNodeType())) ) {
        return CDomNodeFilter::eFilter_Reject;
    }
    if ( !m_Filter ) {
        return CDomNodeFilter::eFilter_Accept;
    }
    CFilterActiveGuard guard(m_Active);
    return m_Filter->AcceptNode(node);
}


bool CDomNodeIterator::x_IsReferenceValid(void) const
{
    if ( m_Reference.node->IsInclusiveDescendantOf(*m_Root) ) {
        return true;
    }
    ERR_POST_X(1, Info << "Reference node " <<
               m_Reference.node->GetNodeName() <<
               " left the iterator root; iteration is over");
    return false;
}


CDomNode* CDomNodeIterator::NextNode(void)
{
    if ( m_Active ) {
        NCBI_THROW(CDomException, eInvalidState,
                   "NextNode() called from within the node filter");
    }
    if ( !m_Reference.node  ||  !x_IsReferenceValid() ) {
        return 0;
    }
    SNodePointer candidate = m_Reference;
    while ( candidate.MoveToNext(*m_Root) ) {
        // The filter may have moved the candidate out of the subtree.
        if ( !candidate.node->IsInclusiveDescendantOf(*m_Root) ) {
            break;
        }
        if (Verify(*candidate.node) == CDomNodeFilter::eFilter_Accept) {
            m_Reference = candidate;
            return candidate.node.GetPointer();
        }
    }
    return 0;
}


CDomNode* CDomNodeIterator::PreviousNode(void)
{
    if ( m_Active ) {
        NCBI_THROW(CDomException, eInvalidState,
                   "PreviousNode() called from within the node filter");
    }
    if ( !m_Reference.node  ||  !x_IsReferenceValid() ) {
        return 0;
    }
    SNodePointer candidate = m_Reference;
    while ( candidate.MoveToPrevious(*m_Root) ) {
        if ( !candidate.node->IsInclusiveDescendantOf(*m_Root) ) {
            break;
        }
        if (Verify(*candidate.node) == CDomNodeFilter::eFilter_Accept) {
            m_Reference = candidate;
            return candidate.node.GetPointer();
        }
    }
    return 0;
}


END_SCOPE(domtree)
END_NCBI_SCOPE
