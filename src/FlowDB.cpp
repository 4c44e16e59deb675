#include <iostream>
#include <sstream>
#include <string>

#include <sqlite3.h>

#include <FlowPost/FlowDB.h>
#include <FlowPost/Errors.h>

using std::string;
using std::stringstream;

const string CHAIN_TABLE   = "chain";
const string MARG1_TABLE   = "marginal1d";
const string MARG2_TABLE   = "marginal2d";
const string CLOSED_TABLE  = "closed_form";
const string SUMMARY_TABLE = "summary";

typedef std::unique_ptr<sqlite3_stmt, int(*)(sqlite3_stmt*)> StmtPtr;

namespace {

sqlite3 * _open_db(const string & path) {
    sqlite3 * db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        const string msg = (db != nullptr) ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db); // a handle is allocated even on failure
        throw FLOW::StorageError("cannot open " + path + ": " + msg);
    }
    return db;
}

// the error that triggered the rollback is rethrown by the caller; a failed rollback is only reported
void _rollback(sqlite3 * db) {
    if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "WARNING: rollback failed: " << sqlite3_errmsg(db) << std::endl;
    }
}

StmtPtr _prepare(sqlite3 * db, const string & sql) {
    sqlite3_stmt * stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw FLOW::StorageError("failed to prepare `" + sql + "`: " + sqlite3_errmsg(db));
    }
    return StmtPtr(stmt, sqlite3_finalize);
}

}

namespace FLOW {

FlowDB::FlowDB(const string & path) :
    _db_name(path), _db(_open_db(path), sqlite3_close) {}

void FlowDB::_execute(const string & sql) {
    char * err = nullptr;
    if (sqlite3_exec(_db.get(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        const string msg = err ? err : sqlite3_errmsg(_db.get());
        sqlite3_free(err);
        throw StorageError("failed query `" + sql + "`: " + msg);
    }
}

bool FlowDB::is_setup() {
    StmtPtr s = _prepare(_db.get(), "SELECT COUNT(*) FROM sqlite_master WHERE type == 'table' AND name IN ('"
        + CHAIN_TABLE + "', '" + MARG1_TABLE + "', '" + MARG2_TABLE + "', '" + CLOSED_TABLE + "', '" + SUMMARY_TABLE + "');");
    if (sqlite3_step(s.get()) != SQLITE_ROW) {
        throw StorageError(string("failed to inspect schema: ") + sqlite3_errmsg(_db.get()));
    }
    return sqlite3_column_int(s.get(), 0) == 5;
}

void FlowDB::setup(const size_t verbose) {
    if (is_setup()) {
        if (verbose > 0) { std::cerr << "Results database " << _db_name << " already set up." << std::endl; }
        return;
    }
    _execute("BEGIN EXCLUSIVE;");
    try {
        _execute("create table if not exists " + CHAIN_TABLE + " ( iteration int primary key asc, x1 real, x2 real, x3 real );");
        _execute("create table if not exists " + MARG1_TABLE + " ( dim int, coord real, density real );");
        _execute("create table if not exists " + MARG2_TABLE + " ( dim_a int, dim_b int, coord_a real, coord_b real, density real );");
        _execute("create table if not exists " + CLOSED_TABLE + " ( x2 real, x3 real, log_density real );");
        _execute("create table if not exists " + SUMMARY_TABLE + " ( name text primary key, value real );");
        _execute("COMMIT;");
    } catch (const StorageError &) {
        _rollback(_db.get());
        throw;
    }
    if (verbose > 0) { std::cerr << "Set up results database " << _db_name << std::endl; }
}

void FlowDB::_insert_rows(
    const string & clear_sql,
    const string & insert_sql,
    const Mat2D & rows
) {
    _execute("BEGIN;");
    try {
        _execute(clear_sql);
        StmtPtr s = _prepare(_db.get(), insert_sql);
        for (Eigen::Index r = 0; r < rows.rows(); ++r) {
            for (Eigen::Index c = 0; c < rows.cols(); ++c) {
                sqlite3_bind_double(s.get(), static_cast<int>(c + 1), rows(r, c));
            }
            if (sqlite3_step(s.get()) != SQLITE_DONE) {
                throw StorageError("failed insert `" + insert_sql + "`: " + sqlite3_errmsg(_db.get()));
            }
            sqlite3_reset(s.get());
        }
        s.reset();
        _execute("COMMIT;");
    } catch (const StorageError &) {
        _rollback(_db.get());
        throw;
    }
}

void FlowDB::write_chain(const SampleChain & chain, const size_t verbose) {
    setup();
    Mat2D rows(chain.size(), NFLOW + 1);
    rows.col(0) = Col::LinSpaced(chain.size(), 0, static_cast<float_type>(chain.size()) - 1);
    rows.rightCols(NFLOW) = chain.samples();
    if (verbose > 0) { std::cerr << "Writing " << chain.size() << " chain states to " << _db_name << std::endl; }
    _insert_rows("delete from " + CHAIN_TABLE + ";", "insert into " + CHAIN_TABLE + " values ( ?, ?, ?, ? );", rows);
}

void FlowDB::write_marginal(const size_t dim, const Col & coords, const Col & density) {
    if (coords.size() != density.size()) { throw StorageError("marginal density does not match its coordinates"); }
    setup();
    Mat2D rows(coords.size(), 3);
    rows.col(0).setConstant(static_cast<float_type>(dim));
    rows.col(1) = coords;
    rows.col(2) = density;
    stringstream clear;
    clear << "delete from " << MARG1_TABLE << " where dim = " << dim << ";";
    _insert_rows(clear.str(), "insert into " + MARG1_TABLE + " values ( ?, ?, ? );", rows);
}

void FlowDB::write_marginal(
    const size_t dim_a, const size_t dim_b,
    const Col & coords_a, const Col & coords_b,
    const Mat2D & density
) {
    if (density.rows() != coords_a.size() or density.cols() != coords_b.size()) {
        throw StorageError("2-D marginal density does not match its coordinates");
    }
    setup();
    Mat2D rows(density.size(), 5);
    Eigen::Index r = 0;
    for (Eigen::Index i = 0; i < coords_a.size(); ++i) {
        for (Eigen::Index j = 0; j < coords_b.size(); ++j, ++r) {
            rows.row(r) << static_cast<float_type>(dim_a), static_cast<float_type>(dim_b), coords_a[i], coords_b[j], density(i, j);
        }
    }
    stringstream clear;
    clear << "delete from " << MARG2_TABLE << " where dim_a = " << dim_a << " and dim_b = " << dim_b << ";";
    _insert_rows(clear.str(), "insert into " + MARG2_TABLE + " values ( ?, ?, ?, ?, ? );", rows);
}

void FlowDB::write_closed_form(const Col & x2s, const Col & x3s, const Mat2D & log_density) {
    if (log_density.rows() != x2s.size() or log_density.cols() != x3s.size()) {
        throw StorageError("closed-form density does not match its coordinates");
    }
    setup();
    Mat2D rows(log_density.size(), 3);
    Eigen::Index r = 0;
    for (Eigen::Index i = 0; i < x2s.size(); ++i) {
        for (Eigen::Index j = 0; j < x3s.size(); ++j, ++r) {
            rows.row(r) << x2s[i], x3s[j], log_density(i, j);
        }
    }
    _insert_rows("delete from " + CLOSED_TABLE + ";", "insert into " + CLOSED_TABLE + " values ( ?, ?, ? );", rows);
}

void FlowDB::write_summary(const std::map<string, float_type> & values) {
    setup();
    _execute("BEGIN;");
    try {
        StmtPtr s = _prepare(_db.get(), "insert or replace into " + SUMMARY_TABLE + " values ( ?, ? );");
        for (const auto & kv : values) {
            sqlite3_bind_text(s.get(), 1, kv.first.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(s.get(), 2, kv.second);
            if (sqlite3_step(s.get()) != SQLITE_DONE) {
                throw StorageError("failed to store summary `" + kv.first + "`: " + sqlite3_errmsg(_db.get()));
            }
            sqlite3_reset(s.get());
        }
        s.reset();
        _execute("COMMIT;");
    } catch (const StorageError &) {
        _rollback(_db.get());
        throw;
    }
}

size_t FlowDB::count_rows(const string & table) {
    StmtPtr s = _prepare(_db.get(), "select count(*) from " + table + ";");
    if (sqlite3_step(s.get()) != SQLITE_ROW) {
        throw StorageError("failed to count rows of " + table + ": " + sqlite3_errmsg(_db.get()));
    }
    return static_cast<size_t>(sqlite3_column_int64(s.get(), 0));
}

} // namespace FLOW
