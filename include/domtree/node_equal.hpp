#ifndef DOMTREE___NODE_EQUAL__HPP
#define DOMTREE___NODE_EQUAL__HPP

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

/// @file node_equal.hpp
/// Structural equality of DOM nodes.


#include <domtree/node.hpp>


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/// TRUE if "a" and "b" are the same node or nodes of the same type with
/// equal fields. Elements, documents and document fragments also compare
/// their children pairwise; elements compare their attribute sets
/// regardless of order.
NCBI_XDOMTREE_EXPORT
bool IsEqualNode(const CDomNode& a, const CDomNode& b);


END_SCOPE(domtree)
END_NCBI_SCOPE

#endif  /* DOMTREE___NODE_EQUAL__HPP */
