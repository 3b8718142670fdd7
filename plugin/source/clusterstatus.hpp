#pragma once

#include <string>
#include "checkresult.hpp"
#include "logwriter.hpp"
#include "pveobject.hpp"

/// @brief Evaluates /cluster/status: quorum of the cluster record and membership of the node records
class ClusterStatusEvaluator
{
private:
	ILogWriter &Log;
	CheckResult &Result;

public:
	ClusterStatusEvaluator(ILogWriter &Log, CheckResult &Result) : Log{Log}, Result{Result} {}
	ClusterStatusEvaluator(const ClusterStatusEvaluator &) = delete;
	ClusterStatusEvaluator &operator=(const ClusterStatusEvaluator &) = delete;
	~ClusterStatusEvaluator() = default;

	static std::string GetObjectName(const PveObject &Object) { return Object.GetText("name"); }

	void Evaluate(const PveObjectList &StatusRecords);
};
