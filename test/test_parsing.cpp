// Checks are assert() based and must run in every build type
#undef NDEBUG

#include "../autotag.hh"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using autotag::internal::ArgumentToken;
using Strings = std::vector< std::string >;

int main() {
    namespace ai = autotag::internal;

    //
    // 1. Tag scanning
    //
    {
        const std::string text = "Hello <session:name/>!";
        auto m = ai::find_tag( text, 0, 4096 );
        assert( m.has_value() );
        assert( m->begin == 6 );
        assert( m->end == 21 );
        assert( m->path == "session:name" );
        assert( !m->post_processor.has_value() );
        assert( !m->raw );
        assert( text.substr(m->end) == "!" );
    }
    {
        auto m = ai::find_tag( "<x:items::count~/>", 0, 4096 );
        assert( m.has_value() );
        assert( m->path == "x:items" );
        assert( m->post_processor == std::string("count") );
        assert( m->raw );
        assert( m->end == 18 );
    }
    {
        // Shortest path that leaves a valid "::name" suffix
        auto m = ai::find_tag( "<a::b::c/>", 0, 4096 );
        assert( m && m->path == "a::b" );
        assert( m->post_processor == std::string("c") );

        auto pj = ai::find_tag( "<cookie_obj::pretty-json/>", 0, 4096 );
        assert( pj && pj->path == "cookie_obj" );
        assert( pj->post_processor == std::string("pretty-json") );

        // A single ':' before a hyphenated key is just part of the path
        auto key = ai::find_tag( "<user:first-name/>", 0, 4096 );
        assert( key && key->path == "user:first-name" );
        assert( !key->post_processor );

        auto bare = ai::find_tag( "<json/>", 0, 4096 );
        assert( bare && bare->path == "json" && !bare->post_processor );
    }
    {
        auto call = ai::find_tag( "x <f:greet('a,b', 2)/> y", 0, 4096 );
        assert( call && call->path == "f:greet('a,b', 2)" );
    }
    {
        // Markup that does not close with "/>" or uses other characters
        assert( !ai::find_tag( "<div>text</div>", 0, 4096 ) );
        assert( !ai::find_tag( "a < b and c > d", 0, 4096 ) );
        assert( !ai::find_tag( "<p.x/>", 0, 4096 ) );
        assert( !ai::find_tag( "</>", 0, 4096 ) );
        assert( !ai::find_tag( "<a~~/>", 0, 4096 ) );

        auto second = ai::find_tag( "<<a/>", 0, 4096 );
        assert( second && second->begin == 1 && second->path == "a" );

        auto raw = ai::find_tag( "<a~/>", 0, 4096 );
        assert( raw && raw->raw && raw->path == "a" );
    }
    {
        const std::string text = "<session:user/><get:q/>";
        auto first = ai::find_tag( text, 0, 4096 );
        assert( first && first->path == "session:user" );
        auto next = ai::find_tag( text, first->end, 4096 );
        assert( next && next->path == "get:q" && next->begin == first->end );
        assert( !ai::find_tag( text, next->end, 4096 ) );
    }
    {
        const std::string text = "<" + std::string( 20, 'a' ) + "/>";
        assert( !ai::find_tag( text, 0, 10 ) );
        assert( ai::find_tag( text, 0, 20 ) );
    }

    //
    // 2. Depth-aware path splitting
    //
    assert( ai::split_outside_parentheses( "a(b:c):d" )
        == (Strings{ "a(b:c)", "d" }) );
    assert( ai::split_outside_parentheses( "session:user:name" )
        == (Strings{ "session", "user", "name" }) );
    assert( ai::split_outside_parentheses( "x:f(a:(b:c)):y" )
        == (Strings{ "x", "f(a:(b:c))", "y" }) );
    assert( ai::split_outside_parentheses( "a::b" )
        == (Strings{ "a", "", "b" }) );
    assert( ai::split_outside_parentheses( "a:" ) == (Strings{ "a" }) );
    assert( ai::split_outside_parentheses( ")a:b" )
        == (Strings{ ")a", "b" }) );
    assert( ai::split_outside_parentheses( "" ).empty() );
    assert( ai::split_outside_parentheses( "a,b", ',' )
        == (Strings{ "a", "b" }) );

    assert( ai::max_paren_depth( "f((a))" ) == 2 );
    assert( ai::max_paren_depth( "a)b(c" ) == 1 );
    assert( ai::max_paren_depth( "plain" ) == 0 );

    //
    // 3. Call segments
    //
    {
        auto c = ai::parse_call( "greet('bob')" );
        assert( c && c->name == "greet" && c->raw_args == "'bob'" );

        auto empty = ai::parse_call( "f()" );
        assert( empty && empty->name == "f" && empty->raw_args.empty() );

        auto nested = ai::parse_call( "outer(inner(1), 2)" );
        assert( nested && nested->raw_args == "inner(1), 2" );

        auto quoted = ai::parse_call( "f(')')" );
        assert( quoted && quoted->raw_args == "')'" );

        assert( !ai::parse_call( "name" ) );
        assert( !ai::parse_call( "f(a)(b)" ) );
        assert( !ai::parse_call( "f((a)" ) );
        assert( !ai::parse_call( "my-func()" ) );
        assert( !ai::parse_call( "(a)" ) );
        assert( !ai::parse_call( "f(" ) );
        assert( !ai::parse_call( "f)" ) );

        // Long segments are scanned without recursion
        const std::string arg( 500000, 'a' );
        auto long_call = ai::parse_call( "f('" + arg + "')" );
        assert( long_call && long_call->raw_args.size() == arg.size() + 2 );
        assert( !ai::parse_call( "f('" + arg + "'" ) );
    }

    //
    // 4. Argument splitting
    //
    assert( ai::split_arguments( "'a,b', 2, true" )
        == (Strings{ "'a,b'", "2", "true" }) );
    assert( ai::split_arguments( "" ).empty() );
    assert( ai::split_arguments( "   " ).empty() );
    assert( ai::split_arguments( "\"it's\", 'x'" )
        == (Strings{ "\"it's\"", "'x'" }) );
    assert( ai::split_arguments( "'a\\'b', c" )
        == (Strings{ "'a\\'b'", "c" }) );
    assert( ai::split_arguments( "a," ) == (Strings{ "a", "" }) );

    //
    // 5. Argument classification
    //
    {
        auto s = ai::classify_argument( "'hello'" );
        assert( s.kind == ArgumentToken::Kind::String );
        assert( s.literal == autotag::Value( "hello" ) );

        auto dq = ai::classify_argument( "\"a\\\"b\"" );
        assert( dq.kind == ArgumentToken::Kind::String );
        assert( dq.literal == autotag::Value( "a\"b" ) );

        auto sq = ai::classify_argument( "'a\\'b'" );
        assert( sq.literal == autotag::Value( "a'b" ) );

        auto lone = ai::classify_argument( "'" );
        assert( lone.kind == ArgumentToken::Kind::String );
        assert( lone.literal == autotag::Value( "" ) );
    }
    {
        auto r = ai::classify_argument( "get:page" );
        assert( r.kind == ArgumentToken::Kind::Reference );
        assert( r.source == "get" );
        assert( r.path == (Strings{ "page" }) );
        assert( r.literal.is_null() );

        auto deep = ai::classify_argument( "session:user:id" );
        assert( deep.kind == ArgumentToken::Kind::Reference );
        assert( deep.path == (Strings{ "user", "id" }) );

        // Sources are lowercase only
        auto upper = ai::classify_argument( "Get:page" );
        assert( upper.kind == ArgumentToken::Kind::Unrecognized );

        auto empty_segment = ai::classify_argument( "get::page" );
        assert( empty_segment.kind == ArgumentToken::Kind::Reference );
        assert( empty_segment.path == (Strings{ "", "page" }) );

        assert( ai::classify_argument( "get:" ).kind
            == ArgumentToken::Kind::Unrecognized );
        assert( ai::classify_argument( "get:a b" ).kind
            == ArgumentToken::Kind::Unrecognized );

        const std::string long_ref = "session:" + std::string( 100000, 'k' );
        auto long_token = ai::classify_argument( long_ref );
        assert( long_token.kind == ArgumentToken::Kind::Reference );
        assert( long_token.path.size() == 1 );
    }
    {
        auto i = ai::classify_argument( "42" );
        assert( i.kind == ArgumentToken::Kind::Number );
        assert( i.literal == autotag::Value( 42 ) );
        assert( ai::classify_argument( "+7" ).literal == autotag::Value( 7 ) );
        assert( ai::classify_argument( "-3.5" ).literal
            == autotag::Value( -3.5 ) );
        assert( ai::classify_argument( "1e3" ).literal
            == autotag::Value( 1000.0 ) );
        assert( ai::classify_argument( ".5" ).literal
            == autotag::Value( 0.5 ) );
        assert( ai::classify_argument( "99999999999999999999" )
            .literal.is_float() );
        assert( ai::classify_argument( "5." ).literal == autotag::Value( 5.0 ) );
        assert( ai::classify_argument( "2E-2" ).literal
            == autotag::Value( 0.02 ) );
        for ( const char* junk : { ".", "+", "1e", "e5", "--1", "1.2.3",
            "2-5", "0x10" } )
        {
            assert( ai::classify_argument( junk ).kind
                == ArgumentToken::Kind::Unrecognized );
        }
        assert( ai::classify_argument( std::string( 100000, '7' ) )
            .literal.is_float() );
    }
    {
        auto t = ai::classify_argument( "TRUE" );
        assert( t.kind == ArgumentToken::Kind::Bool );
        assert( t.literal == autotag::Value( true ) );
        assert( ai::classify_argument( "False" ).literal
            == autotag::Value( false ) );

        auto n = ai::classify_argument( "NULL" );
        assert( n.kind == ArgumentToken::Kind::Null && n.literal.is_null() );

        auto junk = ai::classify_argument( "banana" );
        assert( junk.kind == ArgumentToken::Kind::Unrecognized );
        assert( junk.literal.is_null() );
    }

    //
    // 6. Sources and post-processor names
    //
    assert( ai::classify_source( "session" ) == autotag::Source::Session );
    assert( ai::classify_source( "post" ) == autotag::Source::Form );
    assert( ai::classify_source( "get" ) == autotag::Source::Query );
    assert( ai::classify_source( "cookie" ) == autotag::Source::Cookie );
    assert( ai::classify_source( "server" ) == autotag::Source::Server );
    assert( ai::classify_source( "registry" ) == autotag::Source::Registry );
    assert( ai::classify_source( "user" ) == autotag::Source::Global );
    assert( ai::classify_source( "Session" ) == autotag::Source::Global );

    using autotag::PostProcessor;
    assert( ai::classify_post_processor( std::nullopt ) == PostProcessor::None );
    assert( ai::classify_post_processor( std::string("json") )
        == PostProcessor::Json );
    for ( const char* name : { "pjson", "jsonp", "prettyjson", "json-p",
        "pretty-json" } )
    {
        assert( ai::classify_post_processor( std::string(name) )
            == PostProcessor::PrettyJson );
    }
    assert( ai::classify_post_processor( std::string("count") )
        == PostProcessor::Count );
    assert( ai::classify_post_processor( std::string("unset") )
        == PostProcessor::Unset );
    assert( ai::classify_post_processor( std::string("JSON") )
        == PostProcessor::Unknown );

    //
    // 7. Sequence indices
    //
    assert( ai::parse_sequence_index( "0" ) == std::optional< std::size_t >( 0 ) );
    assert( ai::parse_sequence_index( "12" ) == std::optional< std::size_t >( 12 ) );
    assert( !ai::parse_sequence_index( "01" ) );
    assert( !ai::parse_sequence_index( "-1" ) );
    assert( !ai::parse_sequence_index( "" ) );
    assert( !ai::parse_sequence_index( "x" ) );

    std::cout << "All parsing checks passed!\n";
    return 0;
}
