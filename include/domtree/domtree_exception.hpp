#ifndef DOMTREE___DOMTREE_EXCEPTION__HPP
#define DOMTREE___DOMTREE_EXCEPTION__HPP

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

/// @file domtree_exception.hpp
/// DOM tree library exceptions.
///
/// Defines class to generate exceptions from the domtree library.
/// Traversal and iteration never throw; only tree and attribute
/// mutations with invalid arguments do.


#include <corelib/ncbiexpt.hpp>
#include <domtree/domtree_export.h>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
///
/// CDomException --
///
/// Define an extended exception class based on the CException

class NCBI_XDOMTREE_EXPORT CDomException
    : EXCEPTION_VIRTUAL_BASE public CException
{
public:
    enum EErrCode {
        eHierarchyRequest,  ///< Insertion would break the tree structure
        eNotFound,          ///< Node or attribute is not where expected
        eInUseAttribute,    ///< Attribute belongs to another element
        eInvalidState,      ///< Re-entrant node filter invocation
        eNullPtr            ///< Null node passed where one is required
    };

    virtual const char* GetErrCodeString(void) const override;

    NCBI_EXCEPTION_DEFAULT(CDomException, CException);
};


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___DOMTREE_EXCEPTION__HPP */
