#ifndef DOMTREE___LIVE_ITERATOR__HPP
#define DOMTREE___LIVE_ITERATOR__HPP

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

/// @file live_iterator.hpp
/// Sequential iteration over a live indexable container.


#include <corelib/ncbistd.hpp>
#include <corelib/ncbiobj.hpp>


/** @addtogroup DomTree
 *
 * @{
 */


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


/////////////////////////////////////////////////////////////////////////////
///
/// CLiveIndexIterator --
///
/// Cursor (index + done flag) over a container which is queried anew on
/// every step. Nothing is copied: each Next() fetches the item at the
/// current index from the container as it is at that moment.
///
/// Consistency is deliberately weak. If the container shrinks the
/// iteration simply ends earlier; an insertion or removal in front of the
/// cursor shifts the items, so one of them is skipped or returned twice.
/// Once an index lookup comes back empty the iterator stays done, even if
/// the container grows again.
///
/// TContainer must be a CObject and provide
///   typedef ... TItem;             // a CObject as well
///   TItem* Item(Uint4 index);      // NULL past the end

template <class TContainer>
class CLiveIndexIterator
{
public:
    typedef TContainer                  TContainerType;
    typedef typename TContainer::TItem  TItem;
    typedef Uint4                       TIndex;

    /// Result of one step.
    struct SStep
    {
        SStep(void)
            : done(true)
            {
            }
        SStep(TItem* item)
            : done(false), value(item)
            {
            }

        bool        done;
        CRef<TItem> value;   ///< Empty when done
    };

    explicit CLiveIndexIterator(TContainer& container)
        : m_Container(&container),
          m_Index(0),
          m_Done(false)
        {
        }

    SStep Next(void)
        {
            if ( m_Done ) {
                return SStep();
            }
            TItem* item = m_Container->Item(m_Index);
            if ( !item ) {
                m_Done = true;
                return SStep();
            }
            ++m_Index;
            return SStep(item);
        }

    bool IsDone(void) const
        {
            return m_Done;
        }

    /// Index of the item the next call will fetch.
    TIndex GetIndex(void) const
        {
            return m_Index;
        }

    TContainer& GetContainer(void) const
        {
            return *m_Container;
        }

private:
    CRef<TContainer> m_Container;
    TIndex           m_Index;
    bool             m_Done;
};


END_SCOPE(domtree)
END_NCBI_SCOPE


/* @} */

#endif  /* DOMTREE___LIVE_ITERATOR__HPP */
