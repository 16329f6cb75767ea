#ifndef DOMTREE___ERROR_CODES__HPP
#define DOMTREE___ERROR_CODES__HPP

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

/// @file error_codes.hpp
/// Definition of all error codes used in the domtree library
/// (xdomtree.lib).
///


#include <corelib/ncbidiag.hpp>


BEGIN_NCBI_SCOPE


NCBI_DEFINE_ERRCODE_X(DomTree_Node,        2301,  1);
NCBI_DEFINE_ERRCODE_X(DomTree_Collection,  2302,  1);
NCBI_DEFINE_ERRCODE_X(DomTree_Equal,       2303,  1);
NCBI_DEFINE_ERRCODE_X(DomTree_Iterator,    2304,  1);


END_NCBI_SCOPE


#endif  /* DOMTREE___ERROR_CODES__HPP */
