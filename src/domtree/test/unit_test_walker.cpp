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
 *   Unit tests for CDomWalker.
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/test_boost.hpp>
#include <domtree/walker.hpp>

#include <vector>


USING_NCBI_SCOPE;
USING_SCOPE(domtree);


// root(a(b, c), d)
struct STestTree
{
    STestTree(void)
        : root(new CDomElement("root")),
          a(new CDomElement("a")),
          b(new CDomElement("b")),
          c(new CDomText("c")),
          d(new CDomElement("d"))
    {
        a->AppendChild(b.GetPointer())->AppendChild(c.GetPointer());
        root->AppendChild(a.GetPointer())->AppendChild(d.GetPointer());
    }

    CRef<CDomNode> root, a, b, c, d;
};


static vector<CDomNode*> s_Walk(const CDomWalker& walker,
                                CDomNode& root, CDomNode* start = 0)
{
    vector<CDomNode*> result;
    for (CDomNode* node = walker.GetNext(root, start);  node;
         node = walker.GetNext(root, node)) {
        result.push_back(node);
    }
    return result;
}


BOOST_AUTO_TEST_CASE(TestDepthFirst)
{
    STestTree t;
    CDomWalker walker(CDomWalker::eWalk_DepthFirst);

    vector<CDomNode*> nodes = s_Walk(walker, *t.root);
    BOOST_REQUIRE_EQUAL(nodes.size(), 4u);
    BOOST_CHECK(nodes[0] == t.a.GetPointer());
    BOOST_CHECK(nodes[1] == t.b.GetPointer());
    BOOST_CHECK(nodes[2] == t.c.GetPointer());
    BOOST_CHECK(nodes[3] == t.d.GetPointer());

    // Exhaustion is idempotent
    BOOST_CHECK(walker.GetNext(*t.root, t.d.GetPointer()) == 0);
    BOOST_CHECK(walker.GetNext(*t.root, t.d.GetPointer()) == 0);
}


BOOST_AUTO_TEST_CASE(TestDepthFirstFromMiddle)
{
    STestTree t;
    CDomWalker walker;

    vector<CDomNode*> nodes = s_Walk(walker, *t.root, t.b.GetPointer());
    BOOST_REQUIRE_EQUAL(nodes.size(), 2u);
    BOOST_CHECK(nodes[0] == t.c.GetPointer());
    BOOST_CHECK(nodes[1] == t.d.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestDepthFirstStaysInSubtree)
{
    STestTree t;
    CDomWalker walker;

    // Walking the subtree of "a" must not escape to "d"
    vector<CDomNode*> nodes = s_Walk(walker, *t.a);
    BOOST_REQUIRE_EQUAL(nodes.size(), 2u);
    BOOST_CHECK(nodes[0] == t.b.GetPointer());
    BOOST_CHECK(nodes[1] == t.c.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestDepthFirstEmptyRoot)
{
    CRef<CDomNode> root(new CDomElement("root"));
    CDomWalker walker;
    BOOST_CHECK(walker.GetNext(*root, 0) == 0);
    BOOST_CHECK(walker.GetNext(*root, root.GetPointer()) == 0);
}


BOOST_AUTO_TEST_CASE(TestChildlessRootWithSiblings)
{
    STestTree t;
    CDomWalker walker;

    // "b" has a following sibling, "d" follows its parent
    BOOST_CHECK(walker.GetNext(*t.b, 0) == 0);
    BOOST_CHECK(walker.GetNext(*t.b, t.b.GetPointer()) == 0);
    BOOST_CHECK(walker.GetNext(*t.c, 0) == 0);
    BOOST_CHECK(walker.GetNext(*t.d, 0) == 0);
    BOOST_CHECK(s_Walk(walker, *t.b).empty());
}


BOOST_AUTO_TEST_CASE(TestDepthFirstIsRepeatable)
{
    STestTree t;
    CDomWalker walker;
    BOOST_CHECK(s_Walk(walker, *t.root) == s_Walk(walker, *t.root));
}


BOOST_AUTO_TEST_CASE(TestChildren)
{
    STestTree t;
    CDomWalker walker(CDomWalker::eWalk_Children);

    vector<CDomNode*> nodes = s_Walk(walker, *t.root);
    BOOST_REQUIRE_EQUAL(nodes.size(), 2u);
    BOOST_CHECK(nodes[0] == t.a.GetPointer());
    BOOST_CHECK(nodes[1] == t.d.GetPointer());

    BOOST_CHECK(walker.GetNext(*t.root, t.d.GetPointer()) == 0);
    BOOST_CHECK(walker.GetNext(*t.root, t.d.GetPointer()) == 0);
    BOOST_CHECK(walker.GetNext(*t.root, t.root.GetPointer()) == 0);
}


BOOST_AUTO_TEST_CASE(TestNone)
{
    STestTree t;
    CDomWalker walker(CDomWalker::eWalk_None);

    BOOST_CHECK(walker.GetNext(*t.root, 0) == 0);
    BOOST_CHECK(walker.GetNext(*t.root, t.root.GetPointer()) == 0);
    BOOST_CHECK(walker.GetNext(*t.root, t.a.GetPointer()) == 0);
}


BOOST_AUTO_TEST_CASE(TestPreviousInTreeOrder)
{
    STestTree t;

    BOOST_CHECK(CDomWalker::PreviousInTreeOrder(*t.root, t.d.GetPointer())
                == t.c.GetPointer());
    BOOST_CHECK(CDomWalker::PreviousInTreeOrder(*t.root, t.c.GetPointer())
                == t.b.GetPointer());
    BOOST_CHECK(CDomWalker::PreviousInTreeOrder(*t.root, t.b.GetPointer())
                == t.a.GetPointer());
    BOOST_CHECK(CDomWalker::PreviousInTreeOrder(*t.root, t.a.GetPointer())
                == t.root.GetPointer());
    BOOST_CHECK(CDomWalker::PreviousInTreeOrder(*t.root, t.root.GetPointer())
                == 0);
}


BOOST_AUTO_TEST_CASE(TestInsertionBetweenSteps)
{
    STestTree t;
    CDomWalker walker;

    CDomNode* node = walker.GetNext(*t.root, 0);
    BOOST_REQUIRE(node == t.a.GetPointer());

    // New first child of "a" is picked up by the next step
    CRef<CDomNode> x(new CDomElement("x"));
    t.a->InsertBefore(x.GetPointer(), t.b.GetPointer());
    BOOST_CHECK(walker.GetNext(*t.root, node) == x.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestRemovalOfCurrentLeaf)
{
    STestTree t;
    CDomWalker walker;

    CRef<CDomNode> current(walker.GetNext(*t.root, t.b.GetPointer()));
    BOOST_REQUIRE(current.GetPointer() == t.c.GetPointer());

    // A detached leaf has no relatives left: the walk ends
    t.a->RemoveChild(current);
    BOOST_CHECK(current->GetParent() == 0);
    BOOST_CHECK(current->GetNextSibling() == 0);
    BOOST_CHECK(current->GetPreviousSibling() == 0);
    BOOST_CHECK(walker.GetNext(*t.root, current.GetPointer()) == 0);
}


BOOST_AUTO_TEST_CASE(TestRemovalOfCurrentWithChildren)
{
    STestTree t;
    CDomWalker walker;

    CRef<CDomNode> current(walker.GetNext(*t.root, 0));
    BOOST_REQUIRE(current.GetPointer() == t.a.GetPointer());
    t.root->RemoveChild(current);

    // The walker itself does not check containment
    BOOST_CHECK(walker.GetNext(*t.root, current.GetPointer())
                == t.b.GetPointer());
    BOOST_CHECK(walker.GetNext(*t.root, t.c.GetPointer()) == 0);
}
