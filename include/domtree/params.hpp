#ifndef DOMTREE___PARAMS__HPP
#define DOMTREE___PARAMS__HPP

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

/// @file params.hpp
/// Configuration parameters of the domtree library.
///
/// Both parameters live in the [DOMTREE] section of the application
/// registry and can be overridden from the environment:
///
///   [DOMTREE]
///   Check_Recursion  = true    ; DOMTREE_CHECK_RECURSION
///   Collection_Cache = true    ; DOMTREE_COLLECTION_CACHE


#include <corelib/ncbi_param.hpp>


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/// Reject insertions that would make a node its own ancestor.
/// Disabling it saves an ancestor walk per insertion; a cyclic tree
/// makes every traversal loop forever.
NCBI_PARAM_DECL(bool, DOMTREE, Check_Recursion);
typedef NCBI_PARAM_TYPE(DOMTREE, Check_Recursion) TDomTreeCheckRecursion;

/// Let CDomCollection::Item() resume from the last position it returned.
NCBI_PARAM_DECL(bool, DOMTREE, Collection_Cache);
typedef NCBI_PARAM_TYPE(DOMTREE, Collection_Cache) TDomTreeCollectionCache;


END_SCOPE(domtree)
END_NCBI_SCOPE

#endif  /* DOMTREE___PARAMS__HPP */
