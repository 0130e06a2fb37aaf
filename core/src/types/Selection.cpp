#include "b2h5/core/types/Selection.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace b2h5
{

namespace
{

std::string trim(const std::string& s)
{
    auto b = s.find_first_not_of(" \t\n");
    if (b == std::string::npos) {
        return "";
    }
    auto e = s.find_last_not_of(" \t\n");
    return s.substr(b, e - b + 1);
}

std::int64_t parseInt(const std::string& s)
{
    std::size_t used = 0;
    std::int64_t v = 0;
    try {
        v = std::stoll(s, &used, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument("parseSliceExpr: bad integer '" + s + "'");
    }
    if (used != s.size()) {
        throw std::invalid_argument("parseSliceExpr: bad integer '" + s + "'");
    }
    return v;
}

std::optional<std::int64_t> parseOptInt(const std::string& s)
{
    auto t = trim(s);
    if (t.empty()) {
        return std::nullopt;
    }
    return parseInt(t);
}

std::int64_t clampBound(std::int64_t v, std::int64_t n)
{
    if (v < 0) {
        v += n;
    }
    return std::clamp<std::int64_t>(v, 0, n);
}

}  // namespace

// --- Selection ---

bool Selection::isEmpty() const noexcept
{
    return std::find(count.begin(), count.end(), 0) != count.end();
}

bool Selection::unitStep() const noexcept
{
    return std::all_of(step.begin(), step.end(), [](auto s) { return s == 1; });
}

std::size_t Selection::numElements() const noexcept
{
    std::size_t n = 1;
    for (auto c : count) {
        n *= c;
    }
    return n;
}

// --- Parsing ---

SliceExpr parseSliceExpr(const std::string& text)
{
    auto body = trim(text);
    if (!body.empty() && (body.front() == '[' || body.front() == '(')) {
        char close = body.front() == '[' ? ']' : ')';
        if (body.back() != close) {
            throw std::invalid_argument("parseSliceExpr: unbalanced brackets");
        }
        body = trim(body.substr(1, body.size() - 2));
    }

    SliceExpr expr;
    if (body.empty()) {
        return expr;
    }

    std::stringstream ss(body);
    std::string term;
    while (std::getline(ss, term, ',')) {
        term = trim(term);
        if (term.empty()) {
            // A trailing comma is allowed, as in "(3,)"
            if (ss.eof()) {
                break;
            }
            throw std::invalid_argument("parseSliceExpr: empty term in '" + text + "'");
        }
        if (term == "...") {
            expr.push_back(Ellipsis{});
            continue;
        }
        if (term.find(':') == std::string::npos) {
            expr.push_back(Index{parseInt(term)});
            continue;
        }

        std::vector<std::string> parts;
        std::stringstream ts(term);
        std::string part;
        while (std::getline(ts, part, ':')) {
            parts.push_back(part);
        }
        if (term.back() == ':') {
            parts.emplace_back();
        }
        if (parts.size() < 2 || parts.size() > 3) {
            throw std::invalid_argument("parseSliceExpr: bad range '" + term + "'");
        }
        Range r;
        r.start = parseOptInt(parts[0]);
        r.stop = parseOptInt(parts[1]);
        if (parts.size() == 3) {
            r.step = parseOptInt(parts[2]);
        }
        expr.push_back(r);
    }
    return expr;
}

std::string toString(const SliceExpr& expr)
{
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < expr.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        if (auto* ix = std::get_if<Index>(&expr[i])) {
            oss << ix->value;
        } else if (auto* r = std::get_if<Range>(&expr[i])) {
            if (r->start) {
                oss << *r->start;
            }
            oss << ":";
            if (r->stop) {
                oss << *r->stop;
            }
            if (r->step) {
                oss << ":" << *r->step;
            }
        } else {
            oss << "...";
        }
    }
    oss << "]";
    return oss.str();
}

// --- Normalization ---

Selection normalizeSelection(
    const std::vector<std::size_t>& shape, const SliceExpr& expr)
{
    const std::size_t rank = shape.size();

    std::size_t ellipses = 0;
    for (const auto& t : expr) {
        if (std::holds_alternative<Ellipsis>(t)) {
            ++ellipses;
        }
    }
    if (ellipses > 1) {
        throw std::invalid_argument("normalizeSelection: only one ellipsis allowed");
    }
    const std::size_t explicitTerms = expr.size() - ellipses;
    if (explicitTerms > rank) {
        throw std::invalid_argument(
            "normalizeSelection: " + std::to_string(explicitTerms) +
            " indices for a " + std::to_string(rank) + "-d dataset");
    }

    // Expand the ellipsis (or pad at the end) with full ranges
    std::vector<IndexTerm> terms;
    terms.reserve(rank);
    for (const auto& t : expr) {
        if (std::holds_alternative<Ellipsis>(t)) {
            terms.insert(terms.end(), rank - explicitTerms, Range{});
        } else {
            terms.push_back(t);
        }
    }
    while (terms.size() < rank) {
        terms.push_back(Range{});
    }

    Selection sel;
    sel.start.resize(rank);
    sel.count.resize(rank);
    sel.step.resize(rank);
    sel.dropped.resize(rank);

    for (std::size_t i = 0; i < rank; ++i) {
        const auto n = static_cast<std::int64_t>(shape[i]);
        if (const auto* ix = std::get_if<Index>(&terms[i])) {
            std::int64_t v = ix->value < 0 ? ix->value + n : ix->value;
            if (v < 0 || v >= n) {
                throw std::out_of_range(
                    "normalizeSelection: index " + std::to_string(ix->value) +
                    " out of range for axis " + std::to_string(i) +
                    " with size " + std::to_string(n));
            }
            sel.start[i] = static_cast<std::size_t>(v);
            sel.count[i] = 1;
            sel.step[i] = 1;
            sel.dropped[i] = true;
            continue;
        }

        const auto& r = std::get<Range>(terms[i]);
        const std::int64_t step = r.step.value_or(1);
        if (step < 1) {
            throw std::invalid_argument(
                "normalizeSelection: step must be >= 1 (got " +
                std::to_string(step) + ")");
        }
        const std::int64_t start = r.start ? clampBound(*r.start, n) : 0;
        const std::int64_t stop = r.stop ? clampBound(*r.stop, n) : n;
        const std::int64_t count = stop > start ? (stop - start + step - 1) / step : 0;

        sel.start[i] = static_cast<std::size_t>(start);
        sel.count[i] = static_cast<std::size_t>(count);
        sel.step[i] = static_cast<std::size_t>(step);
        sel.dropped[i] = false;
        sel.outputShape.push_back(sel.count[i]);
    }

    return sel;
}

}  // namespace b2h5
