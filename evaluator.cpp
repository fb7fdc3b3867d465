#include "evaluator.hpp"

#include "compiler.hpp"
#include "error.hpp"
#include "function.hpp"

#include <vector>

namespace memocalc {

namespace {

class Reducer {
  public:
    explicit Reducer(Context& context)
        : context_(context) {}

    void pushOperand(const Operand& operand) {
        if (!expectingOperand_) {
            throw EvalError("unexpected operand \"" + toString(operand) +
                            "\"");
        }
        operands_.push_back(evaluate(operand, context_));
        expectingOperand_ = false;
    }

    void pushGrouper(const Grouper& grouper) {
        if (grouper.isOpening()) {
            if (!expectingOperand_) {
                throw EvalError(std::string("unexpected opening symbol \"") +
                                grouper.symbol + "\"");
            }
            symbols_.push_back(grouper);
            return;
        }
        if (expectingOperand_) {
            throw EvalError(std::string("unexpected closing symbol \"") +
                            grouper.symbol + "\"");
        }
        if (symbols_.empty()) {
            throw EvalError(std::string("unmatched closing symbol \"") +
                            grouper.symbol + "\"");
        }
        while (!symbols_.empty()) {
            Symbol top = symbols_.back();
            symbols_.pop_back();
            if (const Grouper* open = std::get_if<Grouper>(&top)) {
                if (!open->matches(grouper)) {
                    throw EvalError(std::string("mismatched grouping symbols \"") +
                                    open->symbol + "\" and \"" +
                                    grouper.symbol + "\"");
                }
                return;
            }
            reduce(std::get<BinaryOperator>(top));
        }
        throw EvalError(std::string("unmatched closing symbol \"") +
                        grouper.symbol + "\"");
    }

    void pushOperator(const BinaryOperator& op) {
        if (expectingOperand_) {
            if (op.symbol == '-') {
                operands_.push_back(Complex(0));
                symbols_.push_back(op);
                return;
            }
            if (op.symbol == '+') {
                return;
            }
            throw EvalError(std::string("unexpected operator \"") + op.symbol +
                            "\"");
        }
        while (!symbols_.empty()) {
            const BinaryOperator* top =
                std::get_if<BinaryOperator>(&symbols_.back());
            if (top == nullptr || op.precedes(*top)) {
                break;
            }
            BinaryOperator pending = *top;
            symbols_.pop_back();
            reduce(pending);
        }
        symbols_.push_back(op);
        expectingOperand_ = true;
    }

    Complex finish() {
        while (!symbols_.empty()) {
            Symbol top = symbols_.back();
            symbols_.pop_back();
            if (const Grouper* g = std::get_if<Grouper>(&top)) {
                throw EvalError(std::string("unmatched grouping symbol \"") +
                                g->symbol + "\"");
            }
            reduce(std::get<BinaryOperator>(top));
        }
        if (operands_.size() != 1) {
            throw EvalError("expression does not evaluate to a single value");
        }
        return operands_.back();
    }

  private:
    void reduce(const BinaryOperator& op) {
        if (operands_.size() < 2) {
            throw EvalError(std::string("not enough operands for operator \"") +
                            op.symbol + "\"");
        }
        Complex right = operands_.back();
        operands_.pop_back();
        Complex left = operands_.back();
        operands_.pop_back();
        operands_.push_back(applyOperator(op, left, right));
    }

    Context& context_;
    std::vector<Complex> operands_;
    std::vector<Symbol> symbols_;
    bool expectingOperand_ = true;
};

Complex evaluateReduction(const FunctionCall& call, Context& context) {
    const std::string& name = call.name();
    const std::vector<Operand>& args = call.args();
    if (args.size() != 4) {
        throw EvalError("function \"" + name +
                        "\" must have exactly four arguments");
    }
    const Variable* counter = std::get_if<Variable>(&args[0]);
    if (counter == nullptr) {
        throw EvalError("function \"" + name +
                        "\" first argument must be a variable");
    }
    if (context.hasVariable(counter->name) ||
        context.findFunction(counter->name) ||
        Context::isReservedCommand(counter->name)) {
        throw EvalError("function \"" + name + "\" counter \"" +
                        counter->name + "\" is already defined");
    }

    Complex first = evaluate(args[1], context);
    Complex last = evaluate(args[2], context);
    if (!isInteger(first) || !isInteger(last)) {
        throw EvalError("function \"" + name +
                        "\" bounds must be integers");
    }
    Real start = first.real();
    Real end = last.real();
    if (start > end) {
        throw EvalError("function \"" + name + "\" start bound " +
                        formatReal(start, context.precision()) +
                        " is greater than end bound " +
                        formatReal(end, context.precision()));
    }

    bool product = name == "prod";
    Complex total = product ? Complex(1) : Complex(0);
    BindingScope scope(context);
    scope.bind(counter->name, makeComplex(start, Real(0)));
    for (Real k = start; k <= end; k = k + 1) {
        context.setVariable(counter->name, makeComplex(k, Real(0)));
        Complex term = evaluate(args[3], context);
        total = product ? multiply(total, term) : add(total, term);
    }
    return total;
}

} // namespace

Complex applyOperator(const BinaryOperator& op, const Complex& left,
                      const Complex& right) {
    std::string what = std::string("operator \"") + op.symbol + "\"";
    switch (op.symbol) {
    case '+':
        return guardNumeric(what, [&] { return add(left, right); });
    case '-':
        return guardNumeric(what, [&] { return subtract(left, right); });
    case '*':
        return guardNumeric(what, [&] { return multiply(left, right); });
    case '/':
        return guardNumeric(what, [&] { return divide(left, right); });
    case '^':
        return guardNumeric(what, [&] { return power(left, right); });
    case '%':
        return guardNumeric(what, [&] { return remainder(left, right); });
    default:
        throw std::logic_error(std::string("INTERNAL ERROR: operator ") +
                               op.symbol + " not implemented");
    }
}

Complex evaluate(const Operand& operand, Context& context) {
    return std::visit(
        Overloaded{
            [](const Numeral& n) { return n.value; },
            [&](const Variable& v) {
                const Complex* value = context.findVariable(v.name);
                if (value == nullptr) {
                    throw EvalError("variable \"" + v.name +
                                    "\" is not defined");
                }
                return *value;
            },
            [&](const ExpressionPtr& e) { return evaluate(*e, context); },
            [&](const FunctionCallPtr& call) {
                return evaluate(*call, context);
            },
        },
        operand);
}

Complex evaluate(const Expression& expression, Context& context) {
    Reducer reducer(context);
    for (const Token& token : expression.tokens()) {
        std::visit(Overloaded{
                       [&](const Operand& o) { reducer.pushOperand(o); },
                       [&](const BinaryOperator& op) { reducer.pushOperator(op); },
                       [&](const Grouper& g) { reducer.pushGrouper(g); },
                   },
                   token);
    }
    return reducer.finish();
}

Complex evaluate(const FunctionCall& call, Context& context) {
    DepthGuard guard(context);
    if (isSpecialForm(call.name())) {
        return evaluateReduction(call, context);
    }
    FunctionPtr function = context.findFunction(call.name());
    if (!function) {
        throw EvalError("function \"" + call.name() + "\" is not defined");
    }
    std::vector<Complex> args;
    args.reserve(call.args().size());
    for (const Operand& arg : call.args()) {
        args.push_back(evaluate(arg, context));
    }
    return function->call(args, context);
}

} // namespace memocalc
