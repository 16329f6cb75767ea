#ifndef DOMTREE___NODE_ITERATOR__HPP
#define DOMTREE___NODE_ITERATOR__HPP

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

/// @file node_iterator.hpp
/// DOM NodeFilter and NodeIterator.


#include <domtree/node.hpp>
#include <functional>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
///
/// CDomNodeFilter --
///
/// User callback deciding which nodes a CDomNodeIterator returns.

class NCBI_XDOMTREE_EXPORT CDomNodeFilter : public CObject
{
public:
    enum EFilterResult {
        eFilter_Accept = 1,
        eFilter_Reject = 2,
        eFilter_Skip   = 3
    };

    /// "whatToShow" bits, one per node type code.
    enum EShowFlags {
        fShow_Element               = 0x1,
        fShow_Attribute             = 0x2,
        fShow_Text                  = 0x4,
        fShow_CDataSection          = 0x8,
        fShow_EntityReference       = 0x10,
        fShow_Entity                = 0x20,
        fShow_ProcessingInstruction = 0x40,
        fShow_Comment               = 0x80,
        fShow_Document              = 0x100,
        fShow_DocumentType          = 0x200,
        fShow_DocumentFragment      = 0x400,
        fShow_Notation              = 0x800,
        fShow_All                   = 0xFFFFFFFF
    };
    typedef Uint4 TWhatToShow;   ///< Bitwise OR of EShowFlags

    virtual ~CDomNodeFilter(void);

    virtual EFilterResult AcceptNode(const CDomNode& node) = 0;

    /// "whatToShow" bit of a node type.
    static TWhatToShow GetShowFlag(CDomNode::ENodeType type);
};


/// Filter calling a function object.
class NCBI_XDOMTREE_EXPORT CDomFunctionFilter : public CDomNodeFilter
{
public:
    typedef function<EFilterResult(const CDomNode&)> TFunction;

    CDomFunctionFilter(const TFunction& func);

    virtual EFilterResult AcceptNode(const CDomNode& node) override;

private:
    TFunction m_Function;
};


/////////////////////////////////////////////////////////////////////////////
///
/// CDomNodeIterator --
///
/// Steps forward and backward through the subtree of a root node in
/// document order, returning the nodes accepted by "what_to_show" and
/// the optional filter. The iterator remembers a reference node and
/// whether it sits before or after it; the subtree is read anew on
/// every step.
///
/// Rejected and skipped nodes are treated alike: the subtree is seen as
/// a flat list. If the reference node is removed from the subtree,
/// both directions return NULL from then on.

class NCBI_XDOMTREE_EXPORT CDomNodeIterator : public CObject
{
public:
    typedef CDomNodeFilter::TWhatToShow   TWhatToShow;
    typedef CDomNodeFilter::EFilterResult EFilterResult;

    CDomNodeIterator(CDomNode&       root,
                     TWhatToShow     what_to_show = CDomNodeFilter::fShow_All,
                     CDomNodeFilter* filter       = 0);
    virtual ~CDomNodeIterator(void);

    /// NULL when there are no more accepted nodes.
    CDomNode* NextNode(void);
    CDomNode* PreviousNode(void);

    /// Apply "what_to_show" and the filter to a node.
    /// Throw CDomException::eInvalidState if called from within the
    /// filter of this iterator.
    EFilterResult Verify(const CDomNode& node);

    CDomNode&       GetRoot(void) const { return *m_Root.GetPointer(); }
    CDomNode*       GetReferenceNode(void) const
        { return m_Reference.node.GetPointerOrNull(); }
    bool            IsPointerBeforeReferenceNode(void) const
        { return m_Reference.is_pointer_before_node; }
    TWhatToShow     GetWhatToShow(void) const { return m_WhatToShow; }
    CDomNodeFilter* GetFilter(void) const
        { return m_Filter.GetPointerOrNull(); }

private:
    // Position between two nodes of the subtree.
    struct SNodePointer
    {
        SNodePointer(void) : is_pointer_before_node(true) {}

        bool MoveToNext(CDomNode& root);
        bool MoveToPrevious(CDomNode& root);

        CRef<CDomNode> node;
        bool           is_pointer_before_node;
    };

    bool x_IsReferenceValid(void) const;

    CRef<CDomNode>       m_Root;
    SNodePointer         m_Reference;
    TWhatToShow          m_WhatToShow;
    CRef<CDomNodeFilter> m_Filter;
    bool                 m_Active;   ///< Filter is running
};


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___NODE_ITERATOR__HPP */
