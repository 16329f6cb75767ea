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
 *   Unit tests for CDomCollection and CDomMatcher.
 *
 */

#include <ncbi_pch.hpp>
#include <corelib/test_boost.hpp>
#include <domtree/collection.hpp>
#include <domtree/params.hpp>


USING_NCBI_SCOPE;
USING_SCOPE(domtree);


// <body>
//   <div id="main" class="box big">
//     <p class="box">text</p>
//     <a href="/x">link</a>
//     <A name="top"></A>
//   </div>
//   <span name="foo"></span>
//   <area href="/map">
// </body>
struct SPage
{
    SPage(void)
        : body(new CDomElement("body")),
          div(new CDomElement("div")),
          p(new CDomElement("p")),
          link(new CDomElement("a")),
          anchor(new CDomElement("A")),
          span(new CDomElement("span")),
          area(new CDomElement("area"))
    {
        div->SetAttribute("id", "main");
        div->SetAttribute("class", "box big");
        p->SetAttribute("class", "box");
        p->AppendChild(new CDomText("text"));
        link->SetAttribute("href", "/x");
        link->AppendChild(new CDomText("link"));
        anchor->SetAttribute("name", "top");
        span->SetAttribute("name", "foo");
        area->SetAttribute("href", "/map");

        div->AppendChild(p.GetPointer())
            ->AppendChild(link.GetPointer())
            ->AppendChild(anchor.GetPointer());
        body->AppendChild(div.GetPointer())
            ->AppendChild(new CDomComment("note"))
            ->AppendChild(span.GetPointer())
            ->AppendChild(area.GetPointer());
    }

    CRef<CDomElement> body, div, p, link, anchor, span, area;
};


BOOST_AUTO_TEST_CASE(TestByTagName)
{
    SPage page;

    CRef<CDomCollection> coll = CDomCollection::ByTagName(page.body.GetPointer(), "a");
    BOOST_CHECK_EQUAL(coll->GetLength(), 2u);
    BOOST_CHECK(coll->Item(0) == page.link.GetPointer());
    BOOST_CHECK(coll->Item(1) == page.anchor.GetPointer());
    BOOST_CHECK(coll->Item(2) == 0);

    BOOST_CHECK_EQUAL(CDomCollection::ByTagName(page.body.GetPointer(), "DIV")
                      ->GetLength(), 1u);
    // Only elements count, the body itself is excluded
    BOOST_CHECK_EQUAL(CDomCollection::ByTagName(page.body.GetPointer(), "*")
                      ->GetLength(), 6u);
    BOOST_CHECK_EQUAL(CDomCollection::ByTagName(page.body.GetPointer(), "*", true)
                      ->GetLength(), 7u);
    BOOST_CHECK(CDomCollection::ByTagName(page.body.GetPointer(), "body", true)->Item(0)
                == page.body.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestByClassName)
{
    SPage page;

    CRef<CDomCollection> box = CDomCollection::ByClassName(page.body.GetPointer(), "box");
    BOOST_CHECK_EQUAL(box->GetLength(), 2u);
    BOOST_CHECK(box->Item(0) == page.div.GetPointer());
    BOOST_CHECK(box->Item(1) == page.p.GetPointer());

    CRef<CDomCollection> both =
        CDomCollection::ByClassName(page.body.GetPointer(), " big  box ");
    BOOST_CHECK_EQUAL(both->GetLength(), 1u);
    BOOST_CHECK(both->Item(0) == page.div.GetPointer());

    BOOST_CHECK_EQUAL(CDomCollection::ByClassName(page.body.GetPointer(), "")
                      ->GetLength(), 0u);
    BOOST_CHECK_EQUAL(CDomCollection::ByClassName(page.body.GetPointer(), "  ")
                      ->GetLength(), 0u);
}


BOOST_AUTO_TEST_CASE(TestByNameLinksAnchors)
{
    SPage page;

    CRef<CDomCollection> named = CDomCollection::ByName(page.body.GetPointer(), "foo");
    BOOST_CHECK_EQUAL(named->GetLength(), 1u);
    BOOST_CHECK(named->Item(0) == page.span.GetPointer());

    CRef<CDomCollection> links = CDomCollection::Links(page.body.GetPointer());
    BOOST_CHECK_EQUAL(links->GetLength(), 2u);
    BOOST_CHECK(links->Item(0) == page.link.GetPointer());
    BOOST_CHECK(links->Item(1) == page.area.GetPointer());

    CRef<CDomCollection> anchors = CDomCollection::Anchors(page.body.GetPointer());
    BOOST_CHECK_EQUAL(anchors->GetLength(), 1u);
    BOOST_CHECK(anchors->Item(0) == page.anchor.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestChildrenAndEmpty)
{
    SPage page;

    // The comment child is not an element
    CRef<CDomCollection> children = CDomCollection::Children(page.body.GetPointer());
    BOOST_CHECK_EQUAL(children->GetLength(), 3u);
    BOOST_CHECK(children->Item(0) == page.div.GetPointer());
    BOOST_CHECK(children->Item(1) == page.span.GetPointer());
    BOOST_CHECK(children->Item(2) == page.area.GetPointer());

    CRef<CDomCollection> empty = CDomCollection::Empty();
    BOOST_CHECK_EQUAL(empty->GetLength(), 0u);
    BOOST_CHECK(empty->Item(0) == 0);
    BOOST_CHECK(empty->NamedItem("main") == 0);
    BOOST_CHECK(empty->GetIterator().Next().done);

    CRef<CDomCollection> no_root = CDomCollection::All(0);
    BOOST_CHECK_EQUAL(no_root->GetLength(), 0u);
}


BOOST_AUTO_TEST_CASE(TestChildlessRoot)
{
    SPage page;

    // "anchor" and "span" have following siblings but no children
    BOOST_CHECK_EQUAL(CDomCollection::ByTagName(page.anchor.GetPointer(), "*")
                      ->GetLength(), 0u);
    BOOST_CHECK_EQUAL(CDomCollection::All(page.span.GetPointer())
                      ->GetLength(), 0u);
    BOOST_CHECK(CDomCollection::All(page.span.GetPointer())->Item(0) == 0);
    BOOST_CHECK_EQUAL(CDomCollection::All(page.span.GetPointer(), true)
                      ->GetLength(), 1u);
}


BOOST_AUTO_TEST_CASE(TestNamedItem)
{
    SPage page;
    CRef<CDomCollection> all = CDomCollection::All(page.body.GetPointer());

    BOOST_CHECK(all->NamedItem("main") == page.div.GetPointer());
    BOOST_CHECK(all->NamedItem("top") == page.anchor.GetPointer());
    BOOST_CHECK(all->NamedItem("foo") == page.span.GetPointer());
    BOOST_CHECK(all->NamedItem("missing") == 0);
    BOOST_CHECK(all->NamedItem("") == 0);
}


BOOST_AUTO_TEST_CASE(TestIterator)
{
    SPage page;
    CRef<CDomCollection> links = CDomCollection::Links(page.body.GetPointer());

    CDomCollection::TIterator it = links->GetIterator();
    BOOST_CHECK(it.Next().value.GetPointer() == page.link.GetPointer());
    BOOST_CHECK(it.Next().value.GetPointer() == page.area.GetPointer());
    BOOST_CHECK(it.Next().done);
    BOOST_CHECK(it.Next().done);
}


BOOST_AUTO_TEST_CASE(TestLiveAfterMutation)
{
    SPage page;
    CRef<CDomCollection> all = CDomCollection::All(page.body.GetPointer());

    BOOST_CHECK(all->Item(2) == page.link.GetPointer());

    // Insert before the cached position
    CRef<CDomElement> first(new CDomElement("h1"));
    page.body->InsertBefore(first.GetPointer(), page.div.GetPointer());
    BOOST_CHECK(all->Item(3) == page.link.GetPointer());
    BOOST_CHECK(all->Item(0) == first.GetPointer());

    // Remove the cached element itself
    BOOST_CHECK(all->Item(3) == page.link.GetPointer());
    page.div->RemoveChild(page.link.GetPointer());
    BOOST_CHECK(all->Item(3) == page.anchor.GetPointer());
    BOOST_CHECK_EQUAL(all->GetLength(), 6u);

    // Attribute changes affect matching
    CRef<CDomCollection> box = CDomCollection::ByClassName(page.body.GetPointer(), "box");
    BOOST_CHECK(box->Item(1) == page.p.GetPointer());
    page.p->SetAttribute("class", "plain");
    BOOST_CHECK(box->Item(1) == 0);
    BOOST_CHECK_EQUAL(box->GetLength(), 1u);
}


BOOST_AUTO_TEST_CASE(TestCacheAcrossTrees)
{
    SPage page;
    CRef<CDomCollection> coll = CDomCollection::All(page.div.GetPointer());
    BOOST_CHECK(coll->Item(1) == page.link.GetPointer());

    // Moving the root into another tree invalidates the cursor
    CRef<CDomNode> other(new CDomDocumentFragment);
    other->AppendChild(page.div.GetPointer());
    page.div->InsertBefore(page.span.GetPointer(), page.link.GetPointer());
    BOOST_CHECK(coll->Item(1) == page.span.GetPointer());
    BOOST_CHECK(coll->Item(2) == page.link.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestForwardScan)
{
    SPage page;
    CRef<CDomCollection> all = CDomCollection::All(page.body.GetPointer());
    Uint4 length = all->GetLength();

    Uint4 count = 0;
    for (Uint4 i = 0;  all->Item(i);  ++i) {
        ++count;
    }
    BOOST_CHECK_EQUAL(count, length);

    // Going backwards restarts from the beginning
    BOOST_CHECK(all->Item(5) == page.area.GetPointer());
    BOOST_CHECK(all->Item(0) == page.div.GetPointer());
}


BOOST_AUTO_TEST_CASE(TestCacheDisabled)
{
    SPage page;
    TDomTreeCollectionCache::SetDefault(false);

    CRef<CDomCollection> all = CDomCollection::All(page.body.GetPointer());
    BOOST_CHECK(all->Item(1) == page.p.GetPointer());
    BOOST_CHECK(all->Item(2) == page.link.GetPointer());
    page.div->RemoveChild(page.p.GetPointer());
    BOOST_CHECK(all->Item(1) == page.link.GetPointer());

    TDomTreeCollectionCache::SetDefault(true);
}


BOOST_AUTO_TEST_CASE(TestMatcher)
{
    CRef<CDomElement> a(new CDomElement("A"));
    a->SetAttribute("href", "#");
    a->SetAttribute("name", "n");

    BOOST_CHECK(CDomMatcher::All().Match(*a));
    BOOST_CHECK( !CDomMatcher::None().Match(*a) );
    BOOST_CHECK(CDomMatcher::TagName("a").Match(*a));
    BOOST_CHECK(CDomMatcher::TagName("*").Match(*a));
    BOOST_CHECK( !CDomMatcher::TagName("b").Match(*a) );
    BOOST_CHECK(CDomMatcher::Links().Match(*a));
    BOOST_CHECK(CDomMatcher::Anchors().Match(*a));
    BOOST_CHECK(CDomMatcher::Name("n").Match(*a));
    BOOST_CHECK( !CDomMatcher::Name("N").Match(*a) );
    BOOST_CHECK( !CDomMatcher::ClassNames("").Match(*a) );
    BOOST_CHECK_EQUAL(CDomMatcher::ClassNames("x").GetType(),
                      CDomMatcher::eMatch_ClassNames);
}
