#ifndef FLOWPOST_FLOWDB_H
#define FLOWPOST_FLOWDB_H

#include <map>
#include <memory>
#include <string>

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Sampler.h>

// forward declaring the sqlite handle
struct sqlite3;

// Results storage for downstream plotting / reporting.
//
// Tables:
//  - chain(iteration, x1, x2, x3)
//  - marginal1d(dim, coord, density)
//  - marginal2d(dim_a, dim_b, coord_a, coord_b, density)
//  - closed_form(x2, x3, log_density)
//  - summary(name, value)
//
// Each write_* replaces whatever the previous run stored for the same artifact,
// inside a single transaction.

namespace FLOW {

class FlowDB {

    public:
        // @throws StorageError if the file cannot be opened
        FlowDB(const std::string & path);

        // @return true if all result tables exist
        bool is_setup();

        // create any missing tables; repeated invocations are harmless
        // @throws StorageError on sqlite errors
        void setup(const size_t verbose = 0);

        void write_chain(const SampleChain & chain, const size_t verbose = 0);

        // `dim` is 0-based; one row per coordinate
        void write_marginal(const size_t dim, const Col & coords, const Col & density);

        // rows of `density` follow coords_a, columns coords_b
        void write_marginal(
            const size_t dim_a, const size_t dim_b,
            const Col & coords_a, const Col & coords_b,
            const Mat2D & density
        );

        void write_closed_form(const Col & x2s, const Col & x3s, const Mat2D & log_density);

        void write_summary(const std::map<std::string, float_type> & values);

        size_t count_rows(const std::string & table);

    private:
        const std::string _db_name;
        const std::unique_ptr<sqlite3, int(*)(sqlite3*)> _db;

        void _execute(const std::string & sql);
        // one transaction: run `clear_sql`, then `insert_sql` once per row of `rows`
        void _insert_rows(
            const std::string & clear_sql,
            const std::string & insert_sql,
            const Mat2D & rows
        );

};

} // namespace FLOW

#endif // FLOWPOST_FLOWDB_H
