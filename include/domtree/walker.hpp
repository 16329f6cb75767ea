#ifndef DOMTREE___WALKER__HPP
#define DOMTREE___WALKER__HPP

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

/// @file walker.hpp
/// Stateless traversal of a live node tree.


#include <domtree/node.hpp>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
///
/// CDomWalker --
///
/// Computes the node that follows "current" under "root" for one of the
/// traversal policies. The walker keeps no cursor and holds no nodes:
/// each call looks at the tree as it is at that moment, so it stays
/// correct when the tree is changed between calls.
///
/// A NULL "current" means "start". The cursor is owned by the caller,
/// who must keep the current node alive (usually with a CRef).

class NCBI_XDOMTREE_EXPORT CDomWalker
{
public:
    enum EWalkPolicy {
        eWalk_DepthFirst,   ///< Whole subtree in document order
        eWalk_Children,     ///< Direct children of root only
        eWalk_None          ///< Nothing at all
    };

    CDomWalker(EWalkPolicy policy = eWalk_DepthFirst)
        : m_Policy(policy)
        {
        }

    EWalkPolicy GetPolicy(void) const
        {
            return m_Policy;
        }

    /// Next node after "current" under "root", NULL when exhausted.
    /// The root itself is never returned.
    CDomNode* GetNext(CDomNode& root, CDomNode* current) const;

    /// Preorder successor of "current" within the subtree of "root".
    ///
    /// The walk never leaves "root": after the last node of the subtree
    /// the result is NULL, and stays NULL for every later call made with
    /// the last node returned.
    static CDomNode* NextDepthFirst(CDomNode& root, CDomNode* current);

    /// First child of root, then its following siblings.
    static CDomNode* NextChild(CDomNode& root, CDomNode* current);

    static CDomNode* NextNone(CDomNode& root, CDomNode* current);

    /// Preorder predecessor of "current", NULL when "current" is "root".
    static CDomNode* PreviousInTreeOrder(CDomNode& root, CDomNode* current);

private:
    EWalkPolicy m_Policy;
};


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___WALKER__HPP */
