/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <lvi/Cluster.hpp>
#include <lvi/LStr.hpp>
#include <lvi/LVBool.hpp>
#include <lvi/Logger.hpp>
#include <lvi/Result.hpp>

namespace lvi {

  // status, code, source
  using ErrorClusterLayout = ClusterLayout<host_packing, LVBool, int32_t, UHandle>;

  // The source every error caught by with_error_cluster() is reported under.
  constexpr const char *interop_error_source = "LVI Interop Error";


  // A view of an error cluster passed in by LabVIEW. The cluster itself, and
  // the string handle inside it, stay owned by the host.
  class ErrorCluster final {
   public:
    // Fails with InvalidHandle if LabVIEW passed a null pointer.
    static Result<ErrorCluster> from_ptr(ErrorClusterPtr ptr);

    bool status(void) const;
    MgErr code(void) const;
    Result<std::string> source(void) const;

    Result<void> set_error(MgErr code, std::string_view source, std::string_view description);
    Result<void> set_warning(MgErr code, std::string_view source, std::string_view description);

    // Lay out a source and description the way LabVIEW's error dialogs split
    // them: "<source>\n<ERR>\n<description>".
    static std::string format_error_source(std::string_view source, std::string_view description);

   private:
    explicit ErrorCluster(void *base)
        : m_base(base) {}

    Result<void> set_source(std::string_view source, std::string_view description);

    void *m_base;
  };



  // Anything that can be written into an error cluster.
  class ClusterReportable {
   public:
    virtual ~ClusterReportable(void) = default;

    virtual MgErr code(void) const { return bogusError; }
    virtual bool is_error(void) const { return true; }
    virtual std::string source(void) const { return ""; }
    virtual std::string description(void) const = 0;

    // Write this into the cluster LabVIEW passed us, as an error or a
    // warning depending on is_error().
    Result<void> write_error(ErrorClusterPtr cluster) const;
  };


  // Reports an lvi::Error through an error cluster.
  class ErrorReport final : public ClusterReportable {
   public:
    explicit ErrorReport(Error error)
        : m_error(error) {}

    MgErr code(void) const override { return m_error.code(); }
    std::string source(void) const override { return interop_error_source; }
    std::string description(void) const override { return m_error.to_string(); }

   private:
    Error m_error;
  };


  // Run `fn(args...)` on behalf of a host call that carries an error cluster.
  // If the incoming cluster already holds an error, `fn` is skipped and that
  // error's code is returned. If `fn` fails, the failure is written into the
  // cluster and its code returned. Otherwise returns mgNoErr.
  template <typename Fn, typename... Args>
  MgErr with_error_cluster(ErrorClusterPtr cluster_ptr, Fn &&fn, Args &&...args) {
    auto cluster = ErrorCluster::from_ptr(cluster_ptr);
    if (!cluster) return cluster.error().code();
    if (cluster.value().status()) return cluster.value().code();

    auto result = fn(std::forward<Args>(args)...);
    if (result.ok()) return mgNoErr;

    const Error &err = result.error();
    auto written = cluster.value().set_error(err.code(), interop_error_source, err.to_string());
    if (!written) {
      log_error("could not write '%s' into the error cluster: %s", err.to_string().c_str(),
          written.error().to_string().c_str());
    }
    return err.code();
  }
}  // namespace lvi
