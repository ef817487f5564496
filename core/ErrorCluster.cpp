/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <lvi/ErrorCluster.hpp>

namespace lvi {

  using StatusField = ErrorClusterLayout::field<0>;
  using CodeField = ErrorClusterLayout::field<1>;
  using SourceField = ErrorClusterLayout::field<2>;


  Result<ErrorCluster> ErrorCluster::from_ptr(ErrorClusterPtr ptr) {
    if (ptr == nullptr) return Error(ErrorKind::InvalidHandle);
    return ErrorCluster(static_cast<void *>(ptr));
  }


  bool ErrorCluster::status(void) const { return static_cast<bool>(StatusField::read(m_base)); }

  MgErr ErrorCluster::code(void) const { return CodeField::read(m_base); }


  Result<std::string> ErrorCluster::source(void) const {
    // The string stays with the cluster: borrow it and give it straight back.
    LStrHandle handle = LStrHandle::from_raw(SourceField::read(m_base));
    auto text = lstr_get(handle);
    handle.into_raw();
    return text;
  }


  Result<void> ErrorCluster::set_error(
      MgErr code, std::string_view source, std::string_view description) {
    CodeField::write(m_base, code);
    StatusField::write(m_base, LV_TRUE);
    return set_source(source, description);
  }


  Result<void> ErrorCluster::set_warning(
      MgErr code, std::string_view source, std::string_view description) {
    CodeField::write(m_base, code);
    StatusField::write(m_base, LV_FALSE);
    return set_source(source, description);
  }


  std::string ErrorCluster::format_error_source(
      std::string_view source, std::string_view description) {
    std::string out;
    if (source.empty()) {
      out = "<ERR>\n";
      out += description;
    } else if (description.empty()) {
      out = source;
    } else {
      out = source;
      out += "\n<ERR>\n";
      out += description;
    }
    return out;
  }


  Result<void> ErrorCluster::set_source(std::string_view source, std::string_view description) {
    std::string full = format_error_source(source, description);

    LStrHandle handle = LStrHandle::from_raw(SourceField::read(m_base));
    auto written = lstr_set(handle, full);
    // Whether or not that worked, the (possibly new) handle belongs to the
    // cluster again.
    SourceField::write(m_base, handle.into_raw());
    return written;
  }



  Result<void> ClusterReportable::write_error(ErrorClusterPtr ptr) const {
    LVI_TRY_ASSIGN(ErrorCluster cluster, ErrorCluster::from_ptr(ptr));

    std::string src = source();
    std::string desc = description();
    if (is_error()) return cluster.set_error(code(), src, desc);
    return cluster.set_warning(code(), src, desc);
  }
}  // namespace lvi
