// Rust-like type expressions appearing in contract declarations.
#pragma once
#include <string>
#include <vector>

namespace ifacec
{

    struct TypeExpr
    {
        enum class Kind
        {
            Path,      // a::b::C<args...>
            Reference, // &'lt mut args[0]
            Tuple,     // (args...), unit when empty
            Slice,     // [args[0]]
            Lifetime   // 'lt, only as a generic argument
        } kind{Kind::Path};
        bool global{false};                // Path: leading ::
        std::vector<std::string> segments; // Path
        std::string lifetime;              // Reference (optional), Lifetime
        bool is_mut{false};                // Reference
        std::vector<TypeExpr> args;        // Path generics of last segment; element(s) otherwise

        static TypeExpr path(std::string name, std::vector<TypeExpr> generic_args = {})
        {
            TypeExpr t;
            t.kind = Kind::Path;
            t.segments.push_back(std::move(name));
            t.args = std::move(generic_args);
            return t;
        }
        static TypeExpr reference(TypeExpr elem, bool mut = false, std::string lt = {})
        {
            TypeExpr t;
            t.kind = Kind::Reference;
            t.is_mut = mut;
            t.lifetime = std::move(lt);
            t.args.push_back(std::move(elem));
            return t;
        }
        static TypeExpr unit()
        {
            TypeExpr t;
            t.kind = Kind::Tuple;
            return t;
        }

        bool is_path() const { return kind == Kind::Path; }
        bool is_reference() const { return kind == Kind::Reference; }
        const TypeExpr &elem() const { return args.front(); }
        // Last path segment with any raw prefix removed; empty for non-paths.
        std::string last_ident() const;
        // True for a single-segment path without generic arguments named `ident`.
        bool is_ident(const std::string &ident) const;
    };

    bool operator==(const TypeExpr &a, const TypeExpr &b);
    inline bool operator!=(const TypeExpr &a, const TypeExpr &b) { return !(a == b); }

    std::string to_string(const TypeExpr &t);

    // Copy with every lifetime removed: reference lifetimes cleared, lifetime generic args dropped.
    TypeExpr erase_lifetimes(const TypeExpr &t);
    // Referent of a reference type; the type itself otherwise.
    const TypeExpr &unreferenced(const TypeExpr &t);

} // namespace ifacec
