#ifndef DOMTREE___DOMTREE_EXPORT__H
#define DOMTREE___DOMTREE_EXPORT__H

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

/// @file domtree_export.h
/// Export specifier for the xdomtree library.
///
/// The toolkit keeps its per-library specifiers in corelib/mswin_export.h;
/// xdomtree is built outside of the toolkit tree, so it carries its own.


#include <ncbiconf.h>


#if defined(NCBI_OS_MSWIN)  &&  defined(NCBI_DLL_BUILD)
#  ifdef NCBI_XDOMTREE_EXPORTS
#    define NCBI_XDOMTREE_EXPORT __declspec(dllexport)
#  else
#    define NCBI_XDOMTREE_EXPORT __declspec(dllimport)
#  endif
#else
#  define NCBI_XDOMTREE_EXPORT
#endif


#endif  /* DOMTREE___DOMTREE_EXPORT__H */
