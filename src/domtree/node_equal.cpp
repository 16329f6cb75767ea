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
 *   Per-kind node equality.
 *
 */

#include <ncbi_pch.hpp>
#include <domtree/node_equal.hpp>
#include <domtree/attr_map.hpp>
#include <domtree/error_codes.hpp>


#define NCBI_USE_ERRCODE_X   DomTree_Equal


BEGIN_NCBI_SCOPE
BEGIN_SCOPE(domtree)


static bool s_EqualChildren(const CDomNode& a, const CDomNode& b)
{
    if (a.GetChildCount() != b.GetChildCount()) {
        return false;
    }
    CDomNode::TChildren::const_iterator it_a = a.GetChildren().begin();
    CDomNode::TChildren::const_iterator it_b = b.GetChildren().begin();
    for ( ;  it_a != a.GetChildren().end();  ++it_a, ++it_b) {
        if ( !IsEqualNode(**it_a, **it_b) ) {
            return false;
        }
    }
    return true;
}


static bool s_EqualAttributes(const CDomAttrMap& a, const CDomAttrMap& b)
{
    if (a.GetLength() != b.GetLength()) {
        return false;
    }
    for (Uint4 i = 0;  i < a.GetLength();  ++i) {
        const CDomAttr* attr = a.Item(i);
        const CDomAttr* other =
            b.GetNamedItemNS(attr->GetNamespaceURI(), attr->GetLocalName());
        if ( !other  ||  other->GetValue() != attr->GetValue() ) {
            return false;
        }
    }
    return true;
}


bool IsEqualNode(const CDomNode& a, const CDomNode& b)
{
    if (&a == &b) {
        return true;
    }
    if (a.GetNodeType() != b.GetNodeType()) {
        return false;
    }

    switch ( a.GetNodeType() ) {
    case CDomNode::eDocumentType:
        {{
            const CDomDocumentType& x = static_cast<const CDomDocumentType&>(a);
            const CDomDocumentType& y = static_cast<const CDomDocumentType&>(b);
            return x.GetName()     == y.GetName()      &&
                   x.GetPublicId() == y.GetPublicId()  &&
                   x.GetSystemId() == y.GetSystemId();
        }}
    case CDomNode::eElement:
        {{
            const CDomElement& x = static_cast<const CDomElement&>(a);
            const CDomElement& y = static_cast<const CDomElement&>(b);
            return x.GetNamespaceURI() == y.GetNamespaceURI()  &&
                   x.GetPrefix()       == y.GetPrefix()        &&
                   x.GetLocalName()    == y.GetLocalName()     &&
                   s_EqualAttributes(x.Attributes(), y.Attributes())  &&
                   s_EqualChildren(a, b);
        }}
    case CDomNode::eAttribute:
        {{
            const CDomAttr& x = static_cast<const CDomAttr&>(a);
            const CDomAttr& y = static_cast<const CDomAttr&>(b);
            return x.GetNamespaceURI() == y.GetNamespaceURI()  &&
                   x.GetLocalName()    == y.GetLocalName()     &&
                   x.GetValue()        == y.GetValue();
        }}
    case CDomNode::eText:
    case CDomNode::eCDataSection:
    case CDomNode::eComment:
        return static_cast<const CDomCharacterData&>(a).GetData() ==
               static_cast<const CDomCharacterData&>(b).GetData();
    case CDomNode::eProcessingInstruction:
        {{
            const CDomProcessingInstruction& x =
                static_cast<const CDomProcessingInstruction&>(a);
            const CDomProcessingInstruction& y =
                static_cast<const CDomProcessingInstruction&>(b);
            return x.GetTarget() == y.GetTarget()  &&
                   x.GetData()   == y.GetData();
        }}
    case CDomNode::eDocument:
    case CDomNode::eDocumentFragment:
        return s_EqualChildren(a, b);
    default:
        break;
    }
    ERR_POST_X(1, Warning << "IsEqualNode() is not implemented for node type "
               << int(a.GetNodeType()));
    return false;
}


END_SCOPE(domtree)
END_NCBI_SCOPE
