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
 *   Traversal policies over a live node tree.
 *
 */

#include <ncbi_pch.hpp>
#include <domtree/walker.hpp>


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


CDomNode* CDomWalker::GetNext(CDomNode& root, CDomNode* current) const
{
    switch ( m_Policy ) {
    case eWalk_DepthFirst:
        return NextDepthFirst(root, current);
    case eWalk_Children:
        return NextChild(root, current);
    case eWalk_None:
        return NextNone(root, current);
    }
    return 0;
}


CDomNode* CDomWalker::NextDepthFirst(CDomNode& root, CDomNode* current)
{
    CDomNode* node = current ? current : &root;

    CDomNode* next = node->GetFirstChild();
    if ( next ) {
        return next;
    }
    // Siblings of the root are outside of the walk.
    if (node == &root) {
        return 0;
    }
    next = node->GetNextSibling();
    if ( next ) {
        return next;
    }

    // Climb while "node" closes its parent's children list.
    CDomNode* parent = node->GetParent();
    if ( !parent ) {
        return 0;
    }
    while (node != &root  &&  node == parent->GetLastChild()) {
        node = parent;
        parent = node->GetParent();
        if ( !parent ) {
            break;
        }
    }
    if (node == &root) {
        return 0;
    }
    return node->GetNextSibling();
}


CDomNode* CDomWalker::NextChild(CDomNode& root, CDomNode* current)
{
    if ( !current ) {
        return root.GetFirstChild();
    }
    if (current == &root) {
        return 0;
    }
    return current->GetNextSibling();
}


CDomNode* CDomWalker::NextNone(CDomNode& /*root*/, CDomNode* /*current*/)
{
    return 0;
}


CDomNode* CDomWalker::PreviousInTreeOrder(CDomNode& root, CDomNode* current)
{
    if ( !current  ||  current == &root ) {
        return 0;
    }
    CDomNode* prev = current->GetPreviousSibling();
    if ( !prev ) {
        return current->GetParent();
    }
    // Deepest last descendant of the previous sibling.
    while (CDomNode* last = prev->GetLastChild()) {
        prev = last;
    }
    return prev;
}


END_SCOPE(domtree)
END_NCBI_SCOPE
